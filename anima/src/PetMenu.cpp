#include "../include/PetMenu.h"
#include "../include/Managers.h"
#include "../include/Settings.h"
#include <iostream>

namespace AnimaEngine {

namespace {
constexpr const char* ITEM_INDEX_KEY = "anima-item-index";
}

std::vector<PetMenuItem> BuildPetMenuItems(int petId, bool locked, size_t petCount) {
    std::vector<PetMenuItem> items;

    items.push_back({locked ? "Unlock movement" : "Lock movement", true, false,
                     AppEvent(EventType::TOGGLE_LOCK, petId)});
    items.push_back({"Change character\xE2\x80\xA6", true, false,
                     AppEvent(EventType::OPEN_SELECTOR, petId)});

    // Enforce max 3 pets & min 1 pet
    items.push_back({"Add pet", PetManager::CanAddPet(petCount), false,
                     AppEvent(EventType::ADD_PET, petId)});
    items.push_back({"Remove this pet", PetManager::CanRemovePet(petCount), false,
                     AppEvent(EventType::REMOVE_PET, petId)});

    items.push_back({"", false, true, AppEvent()});
    items.push_back({std::string("Quit ") + APP_NAME, true, false, AppEvent(EventType::SHUTDOWN)});

    return items;
}

PetMenu::PetMenu(EventQueue<AppEvent>* eventQueue) : eventQueue_(eventQueue) {}

PetMenu::~PetMenu() {
    if (menu_) {
        gtk_widget_destroy(menu_);
        menu_ = nullptr;
    }
}

void PetMenu::Popup(int petId, bool locked, size_t petCount) {
    if (menu_) {
        gtk_widget_destroy(menu_);
        menu_ = nullptr;
    }

    items_ = BuildPetMenuItems(petId, locked, petCount);
    menu_ = gtk_menu_new();

    for (size_t i = 0; i < items_.size(); ++i) {
        const auto& entry = items_[i];
        GtkWidget* item = entry.separator
            ? gtk_separator_menu_item_new()
            : gtk_menu_item_new_with_label(entry.label.c_str());

        if (!entry.separator) {
            gtk_widget_set_sensitive(item, entry.enabled ? TRUE : FALSE);
            g_object_set_data(G_OBJECT(item), ITEM_INDEX_KEY, GSIZE_TO_POINTER(i));
            g_signal_connect(item, "activate", G_CALLBACK(OnActivate), this);
        }
        gtk_menu_shell_append(GTK_MENU_SHELL(menu_), item);
    }

    gtk_widget_show_all(menu_);

    // The click came from an SDL window, so there is no GdkEvent to anchor
    // the menu to; the legacy call positions it at the pointer instead.
    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    gtk_menu_popup(GTK_MENU(menu_), nullptr, nullptr, nullptr, nullptr, 3, GDK_CURRENT_TIME);
    G_GNUC_END_IGNORE_DEPRECATIONS
}

void PetMenu::OnActivate(GtkMenuItem* item, gpointer self) {
    auto* menu = static_cast<PetMenu*>(self);
    size_t index = GPOINTER_TO_SIZE(g_object_get_data(G_OBJECT(item), ITEM_INDEX_KEY));
    if (index >= menu->items_.size()) {
        std::cerr << "[PetMenu] Unknown menu entry " << index << std::endl;
        return;
    }
    menu->eventQueue_->push(menu->items_[index].event);
}

} // namespace AnimaEngine

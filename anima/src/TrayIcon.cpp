#include "../include/TrayIcon.h"
#include "../include/Settings.h"
#include <iostream>
#include <string>

namespace AnimaEngine {

TrayIcon::TrayIcon(EventQueue<AppEvent>* eventQueue) : eventQueue_(eventQueue) {}

TrayIcon::~TrayIcon() {
    if (menu_) {
        gtk_widget_destroy(menu_);
        menu_ = nullptr;
    }

    if (icon_) {
        g_object_unref(icon_);
        icon_ = nullptr;
    }
}

bool TrayIcon::Init() {
    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    icon_ = gtk_status_icon_new_from_icon_name("computer");
    G_GNUC_END_IGNORE_DEPRECATIONS

    if (!icon_) {
        std::cerr << "[Tray] Failed to create status icon" << std::endl;
        return false;
    }

    std::string showLabel = std::string("Show ") + APP_NAME;
    std::string hideLabel = std::string("Hide ") + APP_NAME;
    std::string quitLabel = std::string("Quit ") + APP_NAME;

    menu_ = gtk_menu_new();
    GtkWidget* showItem = gtk_menu_item_new_with_label(showLabel.c_str());
    GtkWidget* hideItem = gtk_menu_item_new_with_label(hideLabel.c_str());
    GtkWidget* quitItem = gtk_menu_item_new_with_label(quitLabel.c_str());

    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), showItem);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), hideItem);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), quitItem);
    gtk_widget_show_all(menu_);

    g_signal_connect(showItem, "activate", G_CALLBACK(OnShow), this);
    g_signal_connect(hideItem, "activate", G_CALLBACK(OnHide), this);
    g_signal_connect(quitItem, "activate", G_CALLBACK(OnQuit), this);

    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    g_signal_connect(icon_, "popup-menu", G_CALLBACK(OnPopupMenu), this);
    gtk_status_icon_set_tooltip_text(icon_, APP_NAME);
    gtk_status_icon_set_title(icon_, APP_NAME);
    gtk_status_icon_set_visible(icon_, TRUE);
    G_GNUC_END_IGNORE_DEPRECATIONS

    std::cout << "[Tray] Initialized" << std::endl;
    return true;
}

void TrayIcon::Push(EventType type) {
    eventQueue_->push(AppEvent(type));
}

void TrayIcon::OnPopupMenu(GtkStatusIcon* icon, guint button, guint activateTime, gpointer self) {
    auto* tray = static_cast<TrayIcon*>(self);

    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    gtk_menu_popup(GTK_MENU(tray->menu_), nullptr, nullptr,
                   gtk_status_icon_position_menu, icon, button, activateTime);
    G_GNUC_END_IGNORE_DEPRECATIONS
}

void TrayIcon::OnShow(GtkMenuItem* item, gpointer self) {
    (void)item;
    static_cast<TrayIcon*>(self)->Push(EventType::SHOW_SELECTOR);
}

void TrayIcon::OnHide(GtkMenuItem* item, gpointer self) {
    (void)item;
    static_cast<TrayIcon*>(self)->Push(EventType::HIDE_SELECTOR);
}

void TrayIcon::OnQuit(GtkMenuItem* item, gpointer self) {
    (void)item;
    static_cast<TrayIcon*>(self)->Push(EventType::SHUTDOWN);
}

} // namespace AnimaEngine

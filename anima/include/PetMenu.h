#pragma once

#include <gtk/gtk.h>
#include <string>
#include <vector>
#include "Utils.h"

namespace AnimaEngine {

// Right-click menu entry; a null event is a separator
struct PetMenuItem {
    std::string label;
    bool enabled = true;
    bool separator = false;
    AppEvent event;
};

/**
 * @brief Entries of a pet's context menu, given its state and the pet count
 */
std::vector<PetMenuItem> BuildPetMenuItems(int petId, bool locked, size_t petCount);

/**
 * @brief Right-click context menu shown over a pet
 */
class PetMenu {
public:
    explicit PetMenu(EventQueue<AppEvent>* eventQueue);
    ~PetMenu();

    // Disable copy
    PetMenu(const PetMenu&) = delete;
    PetMenu& operator=(const PetMenu&) = delete;

    /**
     * @brief Pop the menu up at the pointer; the chosen entry is queued
     */
    void Popup(int petId, bool locked, size_t petCount);

private:
    static void OnActivate(GtkMenuItem* item, gpointer self);

    EventQueue<AppEvent>* eventQueue_ = nullptr;
    GtkWidget* menu_ = nullptr;
    std::vector<PetMenuItem> items_;
};

} // namespace AnimaEngine

#pragma once

#include <gtk/gtk.h>
#include <string>
#include <vector>
#include "AnimationCatalog.h"
#include "Utils.h"

namespace AnimaEngine {

/**
 * @brief Companion window for choosing a pet's animation and the opacity
 *
 * Layout:
 *   [ list of animations ] [ preview        ]
 *   [ Use this GIF       ] [ Opacity: N%    ]
 *                          [ ----slider---- ]
 *   [ Add GIF...         ] [ Delete Selected ]
 *
 * Actions are not applied here: they are pushed to the event queue and
 * App applies them to the pets. Closing the window only hides it.
 */
class SelectorWindow {
public:
    SelectorWindow(EventQueue<AppEvent>* eventQueue, std::vector<std::string> paths);
    ~SelectorWindow();

    // Disable copy
    SelectorWindow(const SelectorWindow&) = delete;
    SelectorWindow& operator=(const SelectorWindow&) = delete;

    /**
     * @brief Build the widgets
     * @param opacityPercent Initial slider value
     * @param currentPetId Pet edited by "Use this GIF"
     */
    bool Init(int opacityPercent, int currentPetId);

    void Show();
    void Hide();

    /**
     * @brief Show, raise and focus
     */
    void Present();

    /**
     * @brief Switch which pet "Use this GIF" applies to
     */
    void SetCurrentPet(int petId) { currentPetId_ = petId; }
    int GetCurrentPet() const { return currentPetId_; }

    /**
     * @brief Move the slider and label without queueing an opacity change
     */
    void SetOpacityPercent(int percent);
    int GetOpacityPercent() const;

    /**
     * @brief Append files to the catalog and refresh the list
     */
    void AddFiles(const std::vector<std::string>& files);

    const AnimationCatalog& GetCatalog() const { return catalog_; }

private:
    void RebuildList();
    void SelectRow(int index);
    int CurrentRow() const;

    void UpdatePreview(int index);
    void StopPreview();
    void ShowPreviewFrame();
    void SchedulePreviewFrame();

    void ApplySelection();
    void AddAnimations();
    void DeleteSelected();
    void OnOpacityChanged(int percent);
    void SetOpacityLabel(int percent);

    static void OnRowSelected(GtkListBox* box, GtkListBoxRow* row, gpointer self);
    static void OnUseClicked(GtkButton* button, gpointer self);
    static void OnAddClicked(GtkButton* button, gpointer self);
    static void OnDeleteClicked(GtkButton* button, gpointer self);
    static void OnScaleChanged(GtkRange* range, gpointer self);
    static gboolean OnDeleteEvent(GtkWidget* widget, GdkEvent* event, gpointer self);
    static gboolean OnPreviewTick(gpointer self);
    static void OnChooserResponse(GtkNativeDialog* dialog, gint response, gpointer self);

    EventQueue<AppEvent>* eventQueue_ = nullptr;
    AnimationCatalog catalog_;
    int currentPetId_ = -1;

    GtkWidget* window_ = nullptr;
    GtkWidget* listBox_ = nullptr;
    GtkWidget* previewImage_ = nullptr;
    GtkWidget* previewLabel_ = nullptr;
    GtkWidget* opacityLabel_ = nullptr;
    GtkWidget* opacityScale_ = nullptr;

    GdkPixbufAnimation* previewAnimation_ = nullptr;
    GdkPixbufAnimationIter* previewIter_ = nullptr;
    guint previewTimer_ = 0;

    // Open file chooser; it runs modeless so the pets keep animating
    GtkFileChooserNative* chooser_ = nullptr;
};

} // namespace AnimaEngine

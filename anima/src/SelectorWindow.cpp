#include "../include/SelectorWindow.h"
#include "../include/Settings.h"
#include <filesystem>
#include <iostream>

namespace AnimaEngine {

namespace {

constexpr const char* SELECTOR_TITLE = "Anima Engine \xE2\x80\x93 Choose Character";

bool FileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace

SelectorWindow::SelectorWindow(EventQueue<AppEvent>* eventQueue, std::vector<std::string> paths)
    : eventQueue_(eventQueue), catalog_(std::move(paths)) {}

SelectorWindow::~SelectorWindow() {
    StopPreview();

    if (chooser_) {
        g_signal_handlers_disconnect_by_data(chooser_, this);
        gtk_native_dialog_destroy(GTK_NATIVE_DIALOG(chooser_));
        g_object_unref(chooser_);
        chooser_ = nullptr;
    }

    if (window_) {
        // Rows are destroyed with the window; do not let them call back into us
        g_signal_handlers_disconnect_by_data(listBox_, this);
        g_signal_handlers_disconnect_by_data(opacityScale_, this);
        gtk_widget_destroy(window_);
        window_ = nullptr;
    }
}

bool SelectorWindow::Init(int opacityPercent, int currentPetId) {
    currentPetId_ = currentPetId;

    window_ = gtk_window_new(GTK_WINDOW_TOPLEVEL);
    if (!window_) {
        std::cerr << "[Selector] Failed to create window" << std::endl;
        return false;
    }

    gtk_window_set_title(GTK_WINDOW(window_), SELECTOR_TITLE);
    gtk_widget_set_size_request(window_, SELECTOR_WIDTH, SELECTOR_HEIGHT);
    gtk_window_set_resizable(GTK_WINDOW(window_), FALSE);
    gtk_container_set_border_width(GTK_CONTAINER(window_), 8);

    // --- Widgets ---
    listBox_ = gtk_list_box_new();
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(listBox_), GTK_SELECTION_SINGLE);

    GtkWidget* scroller = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroller), GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(scroller, TRUE);
    gtk_widget_set_hexpand(scroller, TRUE);
    gtk_container_add(GTK_CONTAINER(scroller), listBox_);

    GtkWidget* useButton = gtk_button_new_with_label("Use this GIF");
    GtkWidget* addButton = gtk_button_new_with_label("Add GIF\xE2\x80\xA6");
    GtkWidget* deleteButton = gtk_button_new_with_label("Delete Selected");

    // Preview: the label stands in while no animation is loaded
    previewImage_ = gtk_image_new();
    previewLabel_ = gtk_label_new("Preview");
    gtk_widget_set_no_show_all(previewImage_, TRUE);
    gtk_widget_set_no_show_all(previewLabel_, TRUE);

    GtkWidget* previewBox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_set_size_request(previewBox, PREVIEW_SIZE, PREVIEW_SIZE);
    gtk_widget_set_halign(previewBox, GTK_ALIGN_CENTER);
    gtk_box_pack_start(GTK_BOX(previewBox), previewLabel_, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(previewBox), previewImage_, TRUE, TRUE, 0);

    // 30%-100%: a pet is never made fully invisible
    opacityScale_ = gtk_scale_new_with_range(GTK_ORIENTATION_HORIZONTAL,
                                             MIN_OPACITY_PERCENT, MAX_OPACITY_PERCENT, 1);
    gtk_scale_set_draw_value(GTK_SCALE(opacityScale_), FALSE);
    gtk_range_set_round_digits(GTK_RANGE(opacityScale_), 0);
    gtk_range_set_value(GTK_RANGE(opacityScale_), opacityPercent);
    opacityLabel_ = gtk_label_new(nullptr);
    gtk_widget_set_halign(opacityLabel_, GTK_ALIGN_START);
    SetOpacityLabel(opacityPercent);

    // --- Layouts ---
    GtkWidget* leftLayout = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_box_pack_start(GTK_BOX(leftLayout), scroller, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(leftLayout), useButton, FALSE, FALSE, 0);

    GtkWidget* rightLayout = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_box_pack_start(GTK_BOX(rightLayout), previewBox, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(rightLayout), gtk_label_new(nullptr), FALSE, FALSE, 4);
    gtk_box_pack_start(GTK_BOX(rightLayout), opacityLabel_, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(rightLayout), opacityScale_, FALSE, FALSE, 0);

    GtkWidget* topLayout = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_box_pack_start(GTK_BOX(topLayout), leftLayout, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(topLayout), rightLayout, FALSE, FALSE, 0);

    GtkWidget* buttonsLayout = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_box_set_homogeneous(GTK_BOX(buttonsLayout), TRUE);
    gtk_box_pack_start(GTK_BOX(buttonsLayout), addButton, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(buttonsLayout), deleteButton, TRUE, TRUE, 0);

    GtkWidget* outerLayout = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_box_pack_start(GTK_BOX(outerLayout), topLayout, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(outerLayout), buttonsLayout, FALSE, FALSE, 0);

    gtk_container_add(GTK_CONTAINER(window_), outerLayout);

    // --- Connections ---
    g_signal_connect(listBox_, "row-selected", G_CALLBACK(OnRowSelected), this);
    g_signal_connect(useButton, "clicked", G_CALLBACK(OnUseClicked), this);
    g_signal_connect(addButton, "clicked", G_CALLBACK(OnAddClicked), this);
    g_signal_connect(deleteButton, "clicked", G_CALLBACK(OnDeleteClicked), this);
    g_signal_connect(opacityScale_, "value-changed", G_CALLBACK(OnScaleChanged), this);
    g_signal_connect(window_, "delete-event", G_CALLBACK(OnDeleteEvent), this);

    RebuildList();

    // Auto-select first if exists
    if (!catalog_.Empty()) {
        SelectRow(0);
    }

    std::cout << "[Selector] Initialized with " << catalog_.Size() << " animations" << std::endl;
    return true;
}

void SelectorWindow::Show() {
    if (window_) {
        gtk_widget_show_all(window_);
    }
}

void SelectorWindow::Hide() {
    if (window_) {
        gtk_widget_hide(window_);
    }
}

void SelectorWindow::Present() {
    if (window_) {
        gtk_widget_show_all(window_);
        gtk_window_present(GTK_WINDOW(window_));
    }
}

void SelectorWindow::RebuildList() {
    gtk_list_box_unselect_all(GTK_LIST_BOX(listBox_));

    GList* children = gtk_container_get_children(GTK_CONTAINER(listBox_));
    for (GList* it = children; it != nullptr; it = it->next) {
        gtk_widget_destroy(GTK_WIDGET(it->data));
    }
    g_list_free(children);

    for (const auto& name : catalog_.DisplayNames()) {
        GtkWidget* label = gtk_label_new(name.c_str());
        gtk_widget_set_halign(label, GTK_ALIGN_START);
        gtk_list_box_insert(GTK_LIST_BOX(listBox_), label, -1);
    }
    gtk_widget_show_all(listBox_);

    UpdatePreview(CurrentRow());
}

void SelectorWindow::SelectRow(int index) {
    GtkListBoxRow* row = gtk_list_box_get_row_at_index(GTK_LIST_BOX(listBox_), index);
    if (row) {
        gtk_list_box_select_row(GTK_LIST_BOX(listBox_), row);
    }
}

int SelectorWindow::CurrentRow() const {
    GtkListBoxRow* row = gtk_list_box_get_selected_row(GTK_LIST_BOX(listBox_));
    return row ? gtk_list_box_row_get_index(row) : -1;
}

void SelectorWindow::UpdatePreview(int index) {
    StopPreview();

    auto showText = [this](const char* text) {
        gtk_label_set_text(GTK_LABEL(previewLabel_), text);
        gtk_widget_hide(previewImage_);
        gtk_widget_show(previewLabel_);
    };

    auto path = catalog_.At(index);
    if (!path) {
        showText("Preview");
        return;
    }

    if (!FileExists(*path)) {
        showText("File not found");
        return;
    }

    GError* error = nullptr;
    previewAnimation_ = gdk_pixbuf_animation_new_from_file(path->c_str(), &error);
    if (!previewAnimation_) {
        std::cerr << "[Selector] Cannot preview " << *path << ": "
                  << (error ? error->message : "unknown error") << std::endl;
        if (error) {
            g_error_free(error);
        }
        showText("File not found");
        return;
    }

    previewIter_ = gdk_pixbuf_animation_get_iter(previewAnimation_, nullptr);
    ShowPreviewFrame();
    gtk_widget_hide(previewLabel_);
    gtk_widget_show(previewImage_);
    SchedulePreviewFrame();
}

void SelectorWindow::StopPreview() {
    if (previewTimer_ != 0) {
        g_source_remove(previewTimer_);
        previewTimer_ = 0;
    }
    if (previewIter_) {
        g_object_unref(previewIter_);
        previewIter_ = nullptr;
    }
    if (previewAnimation_) {
        g_object_unref(previewAnimation_);
        previewAnimation_ = nullptr;
    }
    if (previewImage_) {
        gtk_image_clear(GTK_IMAGE(previewImage_));
    }
}

void SelectorWindow::ShowPreviewFrame() {
    GdkPixbuf* frame = gdk_pixbuf_animation_iter_get_pixbuf(previewIter_);
    if (!frame) {
        return;
    }

    GdkPixbuf* scaled = gdk_pixbuf_scale_simple(frame, PREVIEW_SIZE, PREVIEW_SIZE, GDK_INTERP_BILINEAR);
    if (scaled) {
        gtk_image_set_from_pixbuf(GTK_IMAGE(previewImage_), scaled);
        g_object_unref(scaled);
    }
}

void SelectorWindow::SchedulePreviewFrame() {
    int delay = gdk_pixbuf_animation_iter_get_delay_time(previewIter_);
    // -1: static image or last frame of a non-looping animation
    if (delay >= 0) {
        previewTimer_ = g_timeout_add(static_cast<guint>(delay), OnPreviewTick, this);
    }
}

void SelectorWindow::ApplySelection() {
    auto path = catalog_.At(CurrentRow());
    if (!path) {
        return;
    }

    if (!FileExists(*path)) {
        std::cerr << "[Selector] " << *path << " no longer exists" << std::endl;
        return;
    }

    eventQueue_->push(AppEvent(EventType::APPLY_ANIMATION, currentPetId_, *path));
}

void SelectorWindow::AddAnimations() {
    if (chooser_) {
        gtk_native_dialog_show(GTK_NATIVE_DIALOG(chooser_));
        return;
    }

    chooser_ = gtk_file_chooser_native_new(
        "Select GIF files",
        GTK_WINDOW(window_),
        GTK_FILE_CHOOSER_ACTION_OPEN,
        "_Open",
        "_Cancel");
    gtk_file_chooser_set_select_multiple(GTK_FILE_CHOOSER(chooser_), TRUE);

    GtkFileFilter* filter = gtk_file_filter_new();
    gtk_file_filter_set_name(filter, "GIF Images (*.gif)");
    gtk_file_filter_add_pattern(filter, "*.gif");
    gtk_file_filter_add_pattern(filter, "*.GIF");
    gtk_file_chooser_add_filter(GTK_FILE_CHOOSER(chooser_), filter);

    // Not gtk_native_dialog_run(): a nested loop would stall the SDL side
    g_signal_connect(chooser_, "response", G_CALLBACK(OnChooserResponse), this);
    gtk_native_dialog_show(GTK_NATIVE_DIALOG(chooser_));
}

void SelectorWindow::AddFiles(const std::vector<std::string>& files) {
    if (files.empty()) {
        return;
    }

    if (catalog_.Add(files)) {
        std::cout << "[Selector] Catalog now has " << catalog_.Size() << " animations" << std::endl;
        RebuildList();
    }
}

void SelectorWindow::DeleteSelected() {
    auto next = catalog_.RemoveAt(CurrentRow());
    if (!next) {
        return;
    }

    RebuildList();

    // Adjust selection
    if (*next >= 0) {
        SelectRow(*next);
    }
}

void SelectorWindow::OnOpacityChanged(int percent) {
    SetOpacityLabel(percent);
    eventQueue_->push(AppEvent::Opacity(percent));
}

void SelectorWindow::SetOpacityPercent(int percent) {
    if (!opacityScale_) {
        return;
    }

    g_signal_handlers_block_by_func(opacityScale_, reinterpret_cast<gpointer>(OnScaleChanged), this);
    gtk_range_set_value(GTK_RANGE(opacityScale_), percent);
    g_signal_handlers_unblock_by_func(opacityScale_, reinterpret_cast<gpointer>(OnScaleChanged), this);

    SetOpacityLabel(percent);
}

int SelectorWindow::GetOpacityPercent() const {
    if (!opacityScale_) {
        return MAX_OPACITY_PERCENT;
    }
    return static_cast<int>(gtk_range_get_value(GTK_RANGE(opacityScale_)) + 0.5);
}

void SelectorWindow::SetOpacityLabel(int percent) {
    std::string text = "Opacity: " + std::to_string(percent) + "%";
    gtk_label_set_text(GTK_LABEL(opacityLabel_), text.c_str());
}

void SelectorWindow::OnRowSelected(GtkListBox* box, GtkListBoxRow* row, gpointer self) {
    (void)box;
    static_cast<SelectorWindow*>(self)->UpdatePreview(row ? gtk_list_box_row_get_index(row) : -1);
}

void SelectorWindow::OnUseClicked(GtkButton* button, gpointer self) {
    (void)button;
    static_cast<SelectorWindow*>(self)->ApplySelection();
}

void SelectorWindow::OnAddClicked(GtkButton* button, gpointer self) {
    (void)button;
    static_cast<SelectorWindow*>(self)->AddAnimations();
}

void SelectorWindow::OnDeleteClicked(GtkButton* button, gpointer self) {
    (void)button;
    static_cast<SelectorWindow*>(self)->DeleteSelected();
}

void SelectorWindow::OnScaleChanged(GtkRange* range, gpointer self) {
    (void)range;
    auto* selector = static_cast<SelectorWindow*>(self);
    selector->OnOpacityChanged(selector->GetOpacityPercent());
}

gboolean SelectorWindow::OnDeleteEvent(GtkWidget* widget, GdkEvent* event, gpointer self) {
    (void)widget;
    (void)event;
    // Hide instead of destroying: the app stays in the tray
    static_cast<SelectorWindow*>(self)->Hide();
    return TRUE;
}

gboolean SelectorWindow::OnPreviewTick(gpointer self) {
    auto* selector = static_cast<SelectorWindow*>(self);
    selector->previewTimer_ = 0;

    if (!selector->previewIter_) {
        return G_SOURCE_REMOVE;
    }

    gdk_pixbuf_animation_iter_advance(selector->previewIter_, nullptr);
    selector->ShowPreviewFrame();
    selector->SchedulePreviewFrame();
    return G_SOURCE_REMOVE;
}

void SelectorWindow::OnChooserResponse(GtkNativeDialog* dialog, gint response, gpointer self) {
    auto* selector = static_cast<SelectorWindow*>(self);

    std::vector<std::string> files;
    if (response == GTK_RESPONSE_ACCEPT) {
        GSList* names = gtk_file_chooser_get_filenames(GTK_FILE_CHOOSER(dialog));
        for (GSList* it = names; it != nullptr; it = it->next) {
            files.emplace_back(static_cast<char*>(it->data));
            g_free(it->data);
        }
        g_slist_free(names);
    }

    g_signal_handlers_disconnect_by_data(dialog, self);
    g_object_unref(selector->chooser_);
    selector->chooser_ = nullptr;

    selector->AddFiles(files);
}

} // namespace AnimaEngine

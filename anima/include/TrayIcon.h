#pragma once

#include <gtk/gtk.h>
#include "Utils.h"

namespace AnimaEngine {

/**
 * @brief System tray icon with Show / Hide / Quit
 *
 * Uses GtkStatusIcon, which GTK 3 still ships for XEmbed trays and
 * Windows notification areas.
 */
class TrayIcon {
public:
    explicit TrayIcon(EventQueue<AppEvent>* eventQueue);
    ~TrayIcon();

    // Disable copy
    TrayIcon(const TrayIcon&) = delete;
    TrayIcon& operator=(const TrayIcon&) = delete;

    bool Init();

private:
    void Push(EventType type);

    static void OnPopupMenu(GtkStatusIcon* icon, guint button, guint activateTime, gpointer self);
    static void OnShow(GtkMenuItem* item, gpointer self);
    static void OnHide(GtkMenuItem* item, gpointer self);
    static void OnQuit(GtkMenuItem* item, gpointer self);

    EventQueue<AppEvent>* eventQueue_ = nullptr;
    GtkStatusIcon* icon_ = nullptr;
    GtkWidget* menu_ = nullptr;
};

} // namespace AnimaEngine

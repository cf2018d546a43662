#pragma once

#include <SDL.h>
#include <memory>
#include <string>
#include "Utils.h"
#include "ConfigStore.h"
#include "Managers.h"
#include "SelectorWindow.h"
#include "PetMenu.h"
#include "TrayIcon.h"

namespace AnimaEngine {

/**
 * @brief Main Application Class - owns every window and the shared state
 *
 * Single thread:
 * - SDL drives the pet windows and the main loop
 * - GTK (selector, menus, tray) is pumped once per frame
 * - UI callbacks and Lua push AppEvents; ProcessAppEvents applies them
 */
class App {
public:
    App();
    ~App();

    // Disable copy
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * @brief Initialize the application
     */
    bool Init(int argc, char* argv[]);

    /**
     * @brief Run the main application loop
     */
    void Run();

    /**
     * @brief Shutdown the application
     */
    void Shutdown();

private:
    /**
     * @brief Initialize SDL
     */
    bool InitSDL();

    /**
     * @brief Initialize GTK for the selector, menus and tray
     */
    bool InitGTK(int argc, char* argv[]);

    /**
     * @brief Process SDL events
     */
    void ProcessEvents();

    /**
     * @brief Process pending GTK events without blocking
     */
    void PumpGTK();

    /**
     * @brief Process application events from event queue
     */
    void ProcessAppEvents();

    void Update(int deltaMs);
    void Render();
    void Cleanup();

    void OnMouseDown(const SDL_MouseButtonEvent& button);
    void OnMouseUp(const SDL_MouseButtonEvent& button);

    void ApplyAnimation(int petId, const std::string& path);
    void SetOpacity(int percent);
    void AddPet();
    void RemovePet(int petId);
    void ToggleLock(int petId);
    void OpenSelectorFor(int petId);
    void SaveConfig();

    ScreenArea GetScreenArea() const;

    ConfigStore config_;

    // Global Event Bus
    EventQueue<AppEvent> eventQueue_;

    std::unique_ptr<PetManager> petManager_;
    std::unique_ptr<SelectorWindow> selector_;
    std::unique_ptr<PetMenu> petMenu_;
    std::unique_ptr<TrayIcon> trayIcon_;
    std::unique_ptr<ScriptRunner> scriptRunner_;

    // Application state
    bool running_ = false;
    bool sdlInitialized_ = false;

    // Timing
    uint32_t lastFrameTime_ = 0;
};

/**
 * @brief Startup animation: "last_gif" if that file exists, else the default
 *
 * The chosen path is written back to the config.
 */
std::string ResolveStartAnimation(ConfigStore& config);

/**
 * @brief Startup position of the main pet
 *
 * A saved position is clamped to the screen; without one the default
 * corner is used and written back to the config.
 */
Point ResolveMainPosition(ConfigStore& config, const ScreenArea& screen);

/**
 * @brief Idle animation path, or empty when the file is missing
 */
std::string ResolveIdleAnimation();

/**
 * @brief Apply an animation to a pet and remember it as "last_gif"
 *
 * Every producer (selector, context menu, Lua) ends up here. A missing
 * file is refused. An unknown petId falls back to the first pet.
 * @return The pet that was changed, or nullptr if nothing was applied
 */
Pet* ApplyAnimationToRoster(PetManager& pets, ConfigStore& config, int petId, const std::string& path);

/**
 * @brief Pet the selector should edit once removedPet is gone
 * @return selectorPet if it survives, else the first pet (-1 if none)
 */
int SelectorTargetAfterRemoval(PetManager& pets, int selectorPet, int removedPet);

} // namespace AnimaEngine

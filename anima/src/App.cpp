#include "../include/App.h"
#include "../include/Settings.h"
#include <SDL_image.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

namespace AnimaEngine {

namespace {

bool FileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace

std::string ResolveStartAnimation(ConfigStore& config) {
    std::string start = config.LastAnimation().value_or(DEFAULT_ANIMATION);
    if (!FileExists(start)) {
        start = DEFAULT_ANIMATION;
    }
    config.SetLastAnimation(start);
    return start;
}

Point ResolveMainPosition(ConfigStore& config, const ScreenArea& screen) {
    if (auto saved = config.Position()) {
        return PetManager::ClampToScreen({saved->first, saved->second}, screen);
    }

    Point position = PetManager::DefaultMainPosition(screen);
    config.SetPosition(position.x, position.y);
    return position;
}

std::string ResolveIdleAnimation() {
    return FileExists(IDLE_ANIMATION) ? std::string(IDLE_ANIMATION) : std::string();
}

Pet* ApplyAnimationToRoster(PetManager& pets, ConfigStore& config, int petId, const std::string& path) {
    if (pets.Count() == 0) {
        return nullptr;
    }

    if (!FileExists(path)) {
        std::cerr << "[App] Not applying missing animation " << path << std::endl;
        return nullptr;
    }

    // Fall back to the first pet when the edited one has been removed
    Pet* target = pets.Find(petId);
    if (!target) {
        target = pets.First();
    }

    std::cout << "[App] Pet #" << target->GetId() << " -> " << path << std::endl;
    target->SetAnimation(path);

    config.SetLastAnimation(path);
    if (!config.Save()) {
        std::cerr << "[App] Settings were not saved to " << config.GetPath() << std::endl;
    }
    return target;
}

int SelectorTargetAfterRemoval(PetManager& pets, int selectorPet, int removedPet) {
    if (selectorPet != removedPet) {
        return selectorPet;
    }

    Pet* first = pets.First();
    return first ? first->GetId() : -1;
}

App::App() : config_(CONFIG_PATH) {}

App::~App() {
    Shutdown();
}

bool App::Init(int argc, char* argv[]) {
    std::cout << "=== " << APP_NAME << " ===" << std::endl;
    std::cout << "Initializing..." << std::endl;

    // Initialize SDL
    if (!InitSDL()) {
        return false;
    }

    if (!InitGTK(argc, argv)) {
        return false;
    }

    // Load config; a missing or broken file just means defaults
    config_.Load();

    std::string startAnimation = ResolveStartAnimation(config_);
    double targetOpacity = config_.Opacity();
    int initialOpacityPercent = ConfigStore::OpacityToPercent(targetOpacity);

    std::string idleAnimation = ResolveIdleAnimation();
    if (idleAnimation.empty()) {
        std::cout << "[App] No " << IDLE_ANIMATION << ", idle animation disabled" << std::endl;
    }

    // Create the first (main) pet
    petManager_ = std::make_unique<PetManager>(idleAnimation);
    Point position = ResolveMainPosition(config_, GetScreenArea());
    Pet* mainPet = petManager_->CreateMainPet(startAnimation, position, targetOpacity);
    if (!mainPet) {
        std::cerr << "[App] Failed to create main pet" << std::endl;
        return false;
    }

    // Selector starts out targeting the main pet
    std::vector<std::string> choices(DEFAULT_CHOICES.begin(), DEFAULT_CHOICES.end());
    selector_ = std::make_unique<SelectorWindow>(&eventQueue_, std::move(choices));
    if (!selector_->Init(initialOpacityPercent, mainPet->GetId())) {
        std::cerr << "[App] Failed to initialize selector" << std::endl;
        return false;
    }
    selector_->Show();

    petMenu_ = std::make_unique<PetMenu>(&eventQueue_);

    trayIcon_ = std::make_unique<TrayIcon>(&eventQueue_);
    if (!trayIcon_->Init()) {
        std::cerr << "[App] Tray icon unavailable, continuing without it" << std::endl;
        trayIcon_.reset();
    }

    // Initialize Script Runner
    scriptRunner_ = std::make_unique<ScriptRunner>();
    if (!scriptRunner_->Init(&eventQueue_)) {
        std::cerr << "[App] Failed to initialize ScriptRunner" << std::endl;
        return false;
    }
    if (FileExists(SCRIPT_PATH)) {
        if (scriptRunner_->LoadFile(SCRIPT_PATH)) {
            scriptRunner_->CallHook("onStart");
        }
    } else {
        std::cout << "[App] No " << SCRIPT_PATH << ", running without behavior script" << std::endl;
    }

    // Save config once at start
    SaveConfig();

    std::cout << "[App] Initialization complete" << std::endl;
    std::cout << "Controls:" << std::endl;
    std::cout << "  - Drag with left mouse to move a pet" << std::endl;
    std::cout << "  - Double-click a pet to lock/unlock it" << std::endl;
    std::cout << "  - Right-click a pet for its menu" << std::endl;
    std::cout << "  - Tray icon: show/hide selector, quit" << std::endl;

    return true;
}

bool App::InitSDL() {
#ifdef _WIN32
    // Enable UTF-8 console output
    SetConsoleOutputCP(CP_UTF8);
#endif

    // Pets are closed by the app, never by the window manager
#ifdef SDL_HINT_QUIT_ON_LAST_WINDOW_CLOSE
    SDL_SetHint(SDL_HINT_QUIT_ON_LAST_WINDOW_CLOSE, "0");
#endif
    // First click on an unfocused pet should start a drag
    SDL_SetHint(SDL_HINT_MOUSE_FOCUS_CLICKTHROUGH, "1");
    // Window opacity needs the compositor
    SDL_SetHint(SDL_HINT_VIDEO_X11_NET_WM_BYPASS_COMPOSITOR, "0");
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "2");

    // Initialize SDL
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "[App] SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    sdlInitialized_ = true;

    const SDL_version* imageVersion = IMG_Linked_Version();
    std::cout << "[App] SDL initialized (SDL_image " << static_cast<int>(imageVersion->major) << "."
              << static_cast<int>(imageVersion->minor) << "." << static_cast<int>(imageVersion->patch)
              << ")" << std::endl;
    return true;
}

bool App::InitGTK(int argc, char* argv[]) {
    if (!gtk_init_check(&argc, &argv)) {
        std::cerr << "[App] gtk_init failed: no display for the selector" << std::endl;
        return false;
    }

    std::cout << "[App] GTK initialized" << std::endl;
    return true;
}

void App::Run() {
    running_ = true;
    lastFrameTime_ = SDL_GetTicks();

    std::cout << "[App] Entering main loop" << std::endl;

    while (running_) {
        // Calculate delta time
        uint32_t currentTime = SDL_GetTicks();
        int deltaMs = static_cast<int>(currentTime - lastFrameTime_);
        lastFrameTime_ = currentTime;

        // Process SDL events
        ProcessEvents();

        // Selector, menus and tray
        PumpGTK();

        // Process application events from event queue
        ProcessAppEvents();

        // Update
        Update(deltaMs);

        // Render
        Render();

        // Frame rate control (60 FPS)
        SDL_Delay(16);
    }

    std::cout << "[App] Main loop ended" << std::endl;
}

void App::ProcessEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                running_ = false;
                break;

            case SDL_MOUSEBUTTONDOWN:
                OnMouseDown(event.button);
                break;

            case SDL_MOUSEBUTTONUP:
                OnMouseUp(event.button);
                break;

            case SDL_MOUSEMOTION:
                if (Pet* pet = petManager_->FindByWindowId(event.motion.windowID)) {
                    pet->OnMotion();
                }
                break;
        }
    }
}

void App::OnMouseDown(const SDL_MouseButtonEvent& button) {
    Pet* pet = petManager_->FindByWindowId(button.windowID);
    if (!pet) {
        return;
    }

    // Any click on a pet makes it the one the selector edits
    selector_->SetCurrentPet(pet->GetId());

    if (button.button != SDL_BUTTON_LEFT) {
        return;
    }

    // Second press of a double click
    if (button.clicks >= 2 && button.clicks % 2 == 0) {
        ToggleLock(pet->GetId());
        return;
    }

    pet->OnPress(button.x, button.y);
    scriptRunner_->CallHook("onClick", pet->GetId(), button.x, button.y);
}

void App::OnMouseUp(const SDL_MouseButtonEvent& button) {
    Pet* pet = petManager_->FindByWindowId(button.windowID);
    if (!pet) {
        return;
    }

    if (button.button == SDL_BUTTON_LEFT) {
        if (pet->OnRelease()) {
            Point pos = pet->GetPosition();
            config_.SetPosition(pos.x, pos.y);
            SaveConfig();
        }
    } else if (button.button == SDL_BUTTON_RIGHT) {
        // Opened on release so SDL's implicit pointer grab is gone
        petMenu_->Popup(pet->GetId(), pet->GetState().IsLocked(), petManager_->Count());
    }
}

void App::PumpGTK() {
    while (gtk_events_pending()) {
        gtk_main_iteration_do(FALSE);
    }
}

void App::ProcessAppEvents() {
    while (true) {
        auto eventOpt = eventQueue_.tryPop();
        if (!eventOpt.has_value()) {
            break;
        }

        const AppEvent& event = *eventOpt;

        switch (event.type) {
            case EventType::APPLY_ANIMATION:
                ApplyAnimation(event.petId, event.payload);
                break;

            case EventType::SET_OPACITY:
                SetOpacity(event.value);
                break;

            case EventType::ADD_PET:
                AddPet();
                break;

            case EventType::REMOVE_PET:
                RemovePet(event.petId);
                break;

            case EventType::TOGGLE_LOCK:
                ToggleLock(event.petId);
                break;

            case EventType::OPEN_SELECTOR:
                OpenSelectorFor(event.petId);
                break;

            case EventType::SHOW_SELECTOR:
                selector_->Present();
                break;

            case EventType::HIDE_SELECTOR:
                selector_->Hide();
                break;

            case EventType::SHUTDOWN:
                std::cout << "[App] Quit requested" << std::endl;
                running_ = false;
                break;
        }
    }
}

void App::ApplyAnimation(int petId, const std::string& path) {
    ApplyAnimationToRoster(*petManager_, config_, petId, path);
}

void App::SetOpacity(int percent) {
    percent = std::max(MIN_OPACITY_PERCENT, std::min(percent, MAX_OPACITY_PERCENT));
    double opacity = percent / 100.0;

    petManager_->ApplyOpacity(opacity);
    selector_->SetOpacityPercent(percent);

    config_.SetOpacity(opacity);
    SaveConfig();
}

void App::AddPet() {
    petManager_->AddPet(DEFAULT_ANIMATION, config_.Opacity(), GetScreenArea());
}

void App::RemovePet(int petId) {
    if (!petManager_->RemovePet(petId)) {
        return;
    }

    selector_->SetCurrentPet(SelectorTargetAfterRemoval(*petManager_, selector_->GetCurrentPet(), petId));
}

void App::ToggleLock(int petId) {
    Pet* pet = petManager_->Find(petId);
    if (!pet) {
        return;
    }

    pet->ToggleLock();
    scriptRunner_->CallHook("onLockChanged", petId, pet->GetState().IsLocked());
}

void App::OpenSelectorFor(int petId) {
    selector_->SetCurrentPet(petId);
    selector_->Present();
}

void App::SaveConfig() {
    if (!config_.Save()) {
        std::cerr << "[App] Settings were not saved to " << config_.GetPath() << std::endl;
    }
}

void App::Update(int deltaMs) {
    for (int petId : petManager_->Update(deltaMs)) {
        scriptRunner_->CallHook("onIdle", petId);
    }
}

void App::Render() {
    petManager_->Render();
}

ScreenArea App::GetScreenArea() const {
    SDL_Rect bounds;
    if (SDL_GetDisplayUsableBounds(0, &bounds) != 0 && SDL_GetDisplayBounds(0, &bounds) != 0) {
        std::cerr << "[App] Cannot query display bounds: " << SDL_GetError() << std::endl;
        return {1920, 1080};
    }
    return {bounds.w, bounds.h};
}

void App::Shutdown() {
    if (!sdlInitialized_) {
        return; // Already shut down
    }

    std::cout << "[App] Shutting down..." << std::endl;

    running_ = false;

    // Cleanup
    Cleanup();

    std::cout << "[App] Shutdown complete" << std::endl;
}

void App::Cleanup() {
    scriptRunner_.reset();
    trayIcon_.reset();
    petMenu_.reset();
    selector_.reset();

    // Pet windows go before SDL itself
    petManager_.reset();

    IMG_Quit();
    SDL_Quit();
    sdlInitialized_ = false;
}

} // namespace AnimaEngine

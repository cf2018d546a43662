#include "../include/Pet.h"
#include "../include/Settings.h"
#include <SDL_syswm.h>
#include <iostream>

#ifdef _WIN32
#include <windows.h>
#endif

namespace AnimaEngine {

namespace {

Uint32 PetWindowFlags() {
    Uint32 flags = SDL_WINDOW_BORDERLESS | SDL_WINDOW_HIDDEN;
    if (ALWAYS_ON_TOP) {
        flags |= SDL_WINDOW_ALWAYS_ON_TOP;
    }
#ifndef __APPLE__
    // Tool window: no taskbar entry on Windows / Linux
    flags |= SDL_WINDOW_SKIP_TASKBAR | SDL_WINDOW_UTILITY;
#endif
    return flags;
}

} // namespace

Pet::Pet(int id, const std::string& animation, const std::string& idleAnimation, bool persistPosition)
    : id_(id), state_(animation, idleAnimation, persistPosition) {}

Pet::~Pet() {
    clip_.Clear();

    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }

    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
}

bool Pet::Init(int x, int y) {
    std::string title = std::string(APP_NAME) + " #" + std::to_string(id_);
    window_ = SDL_CreateWindow(title.c_str(), x, y, PET_SIZE, PET_SIZE, PetWindowFlags());

    if (!window_) {
        std::cerr << "[Pet] SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
        return false;
    }
    windowId_ = SDL_GetWindowID(window_);

#ifdef _WIN32
    // Enable transparency
    SDL_SysWMinfo wmInfo;
    SDL_VERSION(&wmInfo.version);
    if (SDL_GetWindowWMInfo(window_, &wmInfo)) {
        HWND hwnd = wmInfo.info.win.window;
        SetWindowLong(hwnd, GWL_EXSTYLE, GetWindowLong(hwnd, GWL_EXSTYLE) | WS_EX_LAYERED);
        SetLayeredWindowAttributes(hwnd, RGB(255, 0, 255), 0, LWA_COLORKEY);
    }
#endif

    // No vsync: several pet windows present every frame
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer_) {
        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
    }

    if (!renderer_) {
        std::cerr << "[Pet] SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        return false;
    }

    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

    SyncAnimation();
    SyncOpacity();

    std::cout << "[Pet] #" << id_ << " created at (" << x << ", " << y << ") with "
              << state_.CurrentAnimation() << std::endl;
    return true;
}

void Pet::SetAnimation(const std::string& path) {
    state_.SetAnimation(path);
    SyncAnimation();
}

void Pet::Move(int x, int y) {
    if (window_) {
        SDL_SetWindowPosition(window_, x, y);
    }
}

Point Pet::GetPosition() const {
    Point pos;
    if (window_) {
        SDL_GetWindowPosition(window_, &pos.x, &pos.y);
    }
    return pos;
}

void Pet::SetOpacity(double opacity) {
    state_.SetOpacity(opacity);
    SyncOpacity();
}

void Pet::StartFadeIn(double target) {
    state_.StartFadeIn(target);
    SyncOpacity();
}

void Pet::Show() {
    if (window_) {
        SDL_ShowWindow(window_);
    }
}

void Pet::Raise() {
    if (window_) {
        SDL_RaiseWindow(window_);
    }
}

void Pet::OnPress(int localX, int localY) {
    state_.Press(localX, localY);
    SyncAnimation();
}

void Pet::OnMotion() {
    int mouseX, mouseY;
    Uint32 buttons = SDL_GetGlobalMouseState(&mouseX, &mouseY);
    if (!(buttons & SDL_BUTTON_LMASK)) {
        return;
    }

    if (auto pos = state_.DragTo(mouseX, mouseY)) {
        Move(pos->x, pos->y);
    }
}

bool Pet::OnRelease() {
    return state_.Release();
}

void Pet::ToggleLock() {
    state_.ToggleLock();
    std::cout << "[Pet] #" << id_ << (state_.IsLocked() ? " locked" : " unlocked") << std::endl;
}

bool Pet::Update(int deltaMs) {
    bool wentIdle = state_.Update(deltaMs);
    if (wentIdle) {
        std::cout << "[Pet] #" << id_ << " idle" << std::endl;
        SyncAnimation();
    }

    clip_.Update(deltaMs);
    SyncOpacity();
    return wentIdle;
}

void Pet::Render() {
    if (!renderer_) {
        return;
    }

    // Magenta is the transparency colour key on Windows
    SDL_SetRenderDrawColor(renderer_, 255, 0, 255, 255);
    SDL_RenderClear(renderer_);

    clip_.Render(renderer_, nullptr);

    SDL_RenderPresent(renderer_);
}

void Pet::SyncAnimation() {
    if (!renderer_) {
        return;
    }

    const std::string& wanted = state_.CurrentAnimation();
    if (clip_.GetPath() == wanted) {
        return;
    }

    if (!clip_.Load(renderer_, wanted)) {
        std::cerr << "[Pet] #" << id_ << " cannot display " << wanted << std::endl;
    }
}

void Pet::SyncOpacity() {
    if (!window_) {
        return;
    }

    double opacity = state_.GetOpacity();
    if (opacity == appliedOpacity_) {
        return;
    }
    appliedOpacity_ = opacity;

    if (SDL_SetWindowOpacity(window_, static_cast<float>(opacity)) != 0 && !opacityWarned_) {
        std::cerr << "[Pet] #" << id_ << " window opacity not supported: " << SDL_GetError() << std::endl;
        opacityWarned_ = true;
    }
}

} // namespace AnimaEngine

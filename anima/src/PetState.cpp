#include "../include/PetState.h"
#include "../include/Settings.h"
#include <algorithm>

namespace AnimaEngine {

PetState::PetState(const std::string& animation, const std::string& idleAnimation, bool persistPosition)
    : activeAnimation_(animation),
      currentAnimation_(animation),
      idleAnimation_(idleAnimation),
      persistPosition_(persistPosition) {
    ResetIdleTimer();
}

void PetState::SetAnimation(const std::string& path) {
    activeAnimation_ = path;
    currentAnimation_ = path;
    idle_ = false;
    ResetIdleTimer();
}

void PetState::ResetIdleTimer() {
    if (!idleAnimation_.empty()) {
        idleTimerActive_ = true;
        idleRemainingMs_ = IDLE_TIMEOUT_MS;
    } else {
        idleTimerActive_ = false;
        idleRemainingMs_ = 0;
    }
}

bool PetState::EnterIdle() {
    if (idleAnimation_.empty() || idle_) {
        return false;
    }
    idle_ = true;
    currentAnimation_ = idleAnimation_;
    return true;
}

bool PetState::ExitIdle() {
    bool changed = false;
    if (idle_) {
        idle_ = false;
        currentAnimation_ = activeAnimation_;
        changed = true;
    }
    ResetIdleTimer();
    return changed;
}

void PetState::Press(int localX, int localY) {
    ExitIdle();
    if (!locked_) {
        dragging_ = true;
        dragOffset_ = {localX, localY};
    }
}

std::optional<Point> PetState::DragTo(int globalX, int globalY) const {
    if (!dragging_ || locked_) {
        return std::nullopt;
    }
    return Point{globalX - dragOffset_.x, globalY - dragOffset_.y};
}

bool PetState::Release() {
    dragging_ = false;
    return persistPosition_;
}

void PetState::ToggleLock() {
    locked_ = !locked_;
}

void PetState::StartFadeIn(double target) {
    fadeTarget_ = target;
    fadeStep_ = 0;
    fadeElapsedMs_ = 0;
    opacity_ = 0.0;
    fading_ = true;
}

void PetState::SetOpacity(double opacity) {
    fading_ = false;
    opacity_ = opacity;
}

bool PetState::Update(int deltaMs) {
    if (fading_) {
        fadeElapsedMs_ += deltaMs;
        while (fading_ && fadeElapsedMs_ >= FADE_STEP_MS) {
            fadeElapsedMs_ -= FADE_STEP_MS;
            ++fadeStep_;
            double fraction = std::min(static_cast<double>(fadeStep_) / FADE_STEPS, 1.0);
            opacity_ = fadeTarget_ * fraction;
            if (fraction >= 1.0) {
                fading_ = false;
            }
        }
    }

    if (idleTimerActive_) {
        idleRemainingMs_ -= deltaMs;
        if (idleRemainingMs_ <= 0) {
            // Single shot: stays disarmed until the next interaction
            idleTimerActive_ = false;
            idleRemainingMs_ = 0;
            return EnterIdle();
        }
    }
    return false;
}

} // namespace AnimaEngine

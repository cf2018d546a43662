#include "../include/Animation.h"
#include <SDL_image.h>
#include <iostream>

namespace AnimaEngine {

// ============================================================================
// FrameClock Implementation
// ============================================================================

FrameClock::FrameClock(std::vector<int> delaysMs) : delays_(std::move(delaysMs)) {
    for (auto& delay : delays_) {
        if (delay <= 0) {
            delay = DEFAULT_FRAME_DELAY_MS;
        }
        totalMs_ += delay;
    }
}

bool FrameClock::Advance(int deltaMs) {
    if (delays_.size() < 2 || deltaMs <= 0) {
        return false;
    }

    // Skip whole loops so a long stall does not spin
    elapsedMs_ += deltaMs % totalMs_;

    size_t before = current_;
    while (elapsedMs_ >= delays_[current_]) {
        elapsedMs_ -= delays_[current_];
        current_ = (current_ + 1) % delays_.size();
    }
    return current_ != before;
}

// ============================================================================
// AnimationClip Implementation
// ============================================================================

AnimationClip::~AnimationClip() {
    Clear();
}

bool AnimationClip::Load(SDL_Renderer* renderer, const std::string& path) {
    Clear();
    path_ = path;

    if (!renderer) {
        std::cerr << "[Animation] No renderer for " << path << std::endl;
        return false;
    }

    IMG_Animation* animation = IMG_LoadAnimation(path.c_str());
    if (!animation) {
        std::cerr << "[Animation] Failed to load " << path << ": " << IMG_GetError() << std::endl;
        return false;
    }

    std::vector<int> delays;
    delays.reserve(animation->count);

    for (int i = 0; i < animation->count; ++i) {
        SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, animation->frames[i]);
        if (!texture) {
            std::cerr << "[Animation] Failed to create texture for frame " << i
                      << " of " << path << ": " << SDL_GetError() << std::endl;
            continue;
        }
        SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND);
        frames_.push_back(texture);
        delays.push_back(animation->delays ? animation->delays[i] : 0);
    }

    IMG_FreeAnimation(animation);

    if (frames_.empty()) {
        std::cerr << "[Animation] " << path << " has no usable frames" << std::endl;
        return false;
    }

    clock_ = FrameClock(std::move(delays));
    std::cout << "[Animation] Loaded " << path << " (" << frames_.size() << " frames)" << std::endl;
    return true;
}

void AnimationClip::Update(int deltaMs) {
    clock_.Advance(deltaMs);
}

void AnimationClip::Render(SDL_Renderer* renderer, const SDL_Rect* dst) const {
    if (frames_.empty()) {
        return;
    }
    SDL_RenderCopy(renderer, frames_[clock_.CurrentFrame()], nullptr, dst);
}

void AnimationClip::Clear() {
    for (auto* texture : frames_) {
        SDL_DestroyTexture(texture);
    }
    frames_.clear();
    clock_ = FrameClock();
    path_.clear();
}

} // namespace AnimaEngine

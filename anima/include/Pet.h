#pragma once

#include <SDL.h>
#include <string>
#include "Animation.h"
#include "PetState.h"

namespace AnimaEngine {

/**
 * @brief One on-screen pet: a frameless always-on-top SDL window
 *
 * Mouse handling is split between PetState (what the input means) and
 * this class (applying it to the window). App routes SDL events here by
 * window id.
 */
class Pet {
public:
    Pet(int id, const std::string& animation, const std::string& idleAnimation, bool persistPosition);
    ~Pet();

    // Disable copy
    Pet(const Pet&) = delete;
    Pet& operator=(const Pet&) = delete;

    /**
     * @brief Create the window and renderer and load the first animation
     */
    bool Init(int x, int y);

    /**
     * @brief Change the active animation (leaves idle)
     */
    void SetAnimation(const std::string& path);

    void Move(int x, int y);
    Point GetPosition() const;

    void SetOpacity(double opacity);
    void StartFadeIn(double target);

    void Show();
    void Raise();

    /**
     * @brief Left button pressed inside the window
     */
    void OnPress(int localX, int localY);

    /**
     * @brief Pointer moved while a button may be held
     */
    void OnMotion();

    /**
     * @brief Left button released
     * @return true if the new position should be persisted
     */
    bool OnRelease();

    void ToggleLock();

    /**
     * @brief Advance animation, idle countdown and fade
     * @return true if the pet just went idle
     */
    bool Update(int deltaMs);

    void Render();

    int GetId() const { return id_; }
    Uint32 GetWindowId() const { return windowId_; }
    const PetState& GetState() const { return state_; }

private:
    void SyncAnimation();
    void SyncOpacity();

    int id_;
    PetState state_;

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    Uint32 windowId_ = 0;

    AnimationClip clip_;
    double appliedOpacity_ = -1.0;
    bool opacityWarned_ = false;
};

} // namespace AnimaEngine

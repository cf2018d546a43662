#pragma once

#include <string>
#include <optional>

namespace AnimaEngine {

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/**
 * @brief Interaction and animation state of a single pet
 *
 * Holds no window resources. Pet applies the results to its SDL window:
 * CurrentAnimation() is what should be on screen, GetOpacity() what the
 * window opacity should be.
 */
class PetState {
public:
    /**
     * @param animation Initial active animation path
     * @param idleAnimation Idle animation path, empty to disable idling
     * @param persistPosition Whether releasing a drag should save the position
     */
    PetState(const std::string& animation, const std::string& idleAnimation, bool persistPosition);

    /**
     * @brief Change the active animation and leave idle
     */
    void SetAnimation(const std::string& path);

    /**
     * @brief (Re)arm the idle countdown, or disarm it when no idle animation exists
     */
    void ResetIdleTimer();

    /**
     * @brief Switch to the idle animation
     * @return true if the displayed animation changed
     */
    bool EnterIdle();

    /**
     * @brief Return to the active animation and re-arm the idle countdown
     * @return true if the displayed animation changed
     */
    bool ExitIdle();

    /**
     * @brief Left button pressed at window-local (x, y)
     */
    void Press(int localX, int localY);

    /**
     * @brief Pointer moved to global (x, y)
     * @return New window position if the pet is being dragged
     */
    std::optional<Point> DragTo(int globalX, int globalY) const;

    /**
     * @brief Left button released
     * @return true if the position should be written to the config
     */
    bool Release();

    void ToggleLock();

    /**
     * @brief Start from fully transparent and step towards target
     */
    void StartFadeIn(double target);

    /**
     * @brief Set opacity directly, cancelling any fade in progress
     */
    void SetOpacity(double opacity);

    /**
     * @brief Advance idle countdown and fade
     * @return true if the idle countdown fired and the pet went idle
     */
    bool Update(int deltaMs);

    const std::string& ActiveAnimation() const { return activeAnimation_; }
    const std::string& CurrentAnimation() const { return currentAnimation_; }
    const std::string& IdleAnimation() const { return idleAnimation_; }

    bool IsIdle() const { return idle_; }
    bool IsLocked() const { return locked_; }
    bool IsDragging() const { return dragging_; }
    bool IsFading() const { return fading_; }
    bool PersistsPosition() const { return persistPosition_; }
    bool IdleTimerActive() const { return idleTimerActive_; }
    int IdleRemainingMs() const { return idleRemainingMs_; }
    double GetOpacity() const { return opacity_; }

private:
    std::string activeAnimation_;
    std::string currentAnimation_;
    std::string idleAnimation_;

    bool idle_ = false;
    bool locked_ = false;
    bool dragging_ = false;
    bool persistPosition_ = false;
    Point dragOffset_;

    bool idleTimerActive_ = false;
    int idleRemainingMs_ = 0;

    double opacity_ = 1.0;
    bool fading_ = false;
    double fadeTarget_ = 1.0;
    int fadeStep_ = 0;
    int fadeElapsedMs_ = 0;
};

} // namespace AnimaEngine

#pragma once

#include <SDL.h>
#include <string>
#include <vector>

namespace AnimaEngine {

// Frame delay used when a GIF frame declares none
constexpr int DEFAULT_FRAME_DELAY_MS = 100;

/**
 * @brief Picks the current frame of a looping animation from elapsed time
 */
class FrameClock {
public:
    FrameClock() = default;
    explicit FrameClock(std::vector<int> delaysMs);

    /**
     * @brief Advance by deltaMs, wrapping around the last frame
     * @return true if the current frame changed
     */
    bool Advance(int deltaMs);

    size_t CurrentFrame() const { return current_; }
    size_t FrameCount() const { return delays_.size(); }
    int TotalDurationMs() const { return totalMs_; }

private:
    std::vector<int> delays_;
    size_t current_ = 0;
    int elapsedMs_ = 0;
    int totalMs_ = 0;
};

/**
 * @brief Decoded animation uploaded as one texture per frame
 *
 * Bound to the renderer it was loaded with. Loops forever.
 */
class AnimationClip {
public:
    AnimationClip() = default;
    ~AnimationClip();

    // Disable copy
    AnimationClip(const AnimationClip&) = delete;
    AnimationClip& operator=(const AnimationClip&) = delete;

    /**
     * @brief Decode path (GIF or any still image SDL_image reads)
     * @return false if the file could not be decoded; the clip is then empty
     */
    bool Load(SDL_Renderer* renderer, const std::string& path);

    void Update(int deltaMs);

    /**
     * @brief Draw the current frame scaled to dst (whole target if null)
     */
    void Render(SDL_Renderer* renderer, const SDL_Rect* dst) const;

    void Clear();

    bool IsEmpty() const { return frames_.empty(); }
    const std::string& GetPath() const { return path_; }

private:
    std::vector<SDL_Texture*> frames_;
    FrameClock clock_;
    std::string path_;
};

} // namespace AnimaEngine

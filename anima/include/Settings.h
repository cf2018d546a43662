#pragma once

#include <array>

namespace AnimaEngine {

// Animations offered by the selector on first launch
constexpr std::array<const char*, 3> DEFAULT_CHOICES = {
    "gifs/anime_character5.gif",
    "gifs/anime_character2.gif",
    "gifs/anime_character5.gif",
};
constexpr const char* DEFAULT_ANIMATION = "anime_character5.gif";

// Idle animation is only used when this file exists
constexpr const char* IDLE_ANIMATION = "idle.gif";
constexpr int IDLE_TIMEOUT_MS = 15000;

constexpr int PET_SIZE = 250;
constexpr int PREVIEW_SIZE = 180;
constexpr bool ALWAYS_ON_TOP = true;

constexpr int SELECTOR_WIDTH = 520;
constexpr int SELECTOR_HEIGHT = 360;

constexpr double MIN_OPACITY = 0.3;
constexpr double MAX_OPACITY = 1.0;
constexpr int MIN_OPACITY_PERCENT = 30;
constexpr int MAX_OPACITY_PERCENT = 100;

constexpr size_t MAX_PETS = 3;
constexpr size_t MIN_PETS = 1;
constexpr int PET_SPAWN_GAP = 20;

// Default main pet placement, relative to the usable screen area
constexpr int DEFAULT_MARGIN_X = 30;
constexpr int DEFAULT_MARGIN_BOTTOM = 50;

constexpr int FADE_STEPS = 20;
constexpr int FADE_STEP_MS = 30;

constexpr const char* CONFIG_PATH = "anima_config.json";
constexpr const char* SCRIPT_PATH = "scripts/pet.lua";

constexpr const char* APP_NAME = "Anima Engine";

} // namespace AnimaEngine

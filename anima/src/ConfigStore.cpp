#include "../include/ConfigStore.h"
#include "../include/Settings.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

namespace AnimaEngine {

namespace {
constexpr const char* KEY_LAST_ANIMATION = "last_gif";
constexpr const char* KEY_POSITION = "pos";
constexpr const char* KEY_OPACITY = "opacity";
}

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

bool ConfigStore::Load() {
    data_ = nlohmann::json::object();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        std::cout << "[Config] No config at " << path_ << ", using defaults" << std::endl;
        return false;
    }

    std::ifstream file(path_);
    if (!file) {
        std::cerr << "[Config] Cannot open " << path_ << std::endl;
        return false;
    }

    try {
        auto parsed = nlohmann::json::parse(file);
        if (!parsed.is_object()) {
            std::cerr << "[Config] " << path_ << " is not a JSON object, ignoring" << std::endl;
            return false;
        }
        data_ = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Config] Failed to parse " << path_ << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded " << path_ << std::endl;
    return true;
}

bool ConfigStore::Save() const {
    std::ofstream file(path_, std::ios::trunc);
    if (!file) {
        std::cerr << "[Config] Cannot write " << path_ << std::endl;
        return false;
    }

    file << data_.dump(2);
    if (!file) {
        std::cerr << "[Config] Write to " << path_ << " failed" << std::endl;
        return false;
    }
    return true;
}

std::optional<std::string> ConfigStore::LastAnimation() const {
    auto it = data_.find(KEY_LAST_ANIMATION);
    if (it == data_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void ConfigStore::SetLastAnimation(const std::string& path) {
    data_[KEY_LAST_ANIMATION] = path;
}

std::optional<std::pair<int, int>> ConfigStore::Position() const {
    auto it = data_.find(KEY_POSITION);
    if (it == data_.end() || !it->is_array() || it->size() != 2) {
        return std::nullopt;
    }

    const auto& x = (*it)[0];
    const auto& y = (*it)[1];
    if (!x.is_number() || !y.is_number()) {
        return std::nullopt;
    }

    // Hand-edited values that do not fit an int count as absent
    auto fits = [](double v) {
        return v >= static_cast<double>(std::numeric_limits<int>::min()) &&
               v <= static_cast<double>(std::numeric_limits<int>::max());
    };
    double px = x.get<double>();
    double py = y.get<double>();
    if (!fits(px) || !fits(py)) {
        std::cerr << "[Config] Ignoring out-of-range position in " << path_ << std::endl;
        return std::nullopt;
    }
    return std::make_pair(static_cast<int>(px), static_cast<int>(py));
}

void ConfigStore::SetPosition(int x, int y) {
    data_[KEY_POSITION] = {x, y};
}

double ConfigStore::Opacity() const {
    auto it = data_.find(KEY_OPACITY);
    if (it == data_.end() || !it->is_number()) {
        return MAX_OPACITY;
    }
    return ClampOpacity(it->get<double>());
}

void ConfigStore::SetOpacity(double opacity) {
    data_[KEY_OPACITY] = opacity;
}

double ConfigStore::ClampOpacity(double opacity) {
    if (std::isnan(opacity)) {
        return MAX_OPACITY;
    }
    return std::max(MIN_OPACITY, std::min(opacity, MAX_OPACITY));
}

int ConfigStore::OpacityToPercent(double opacity) {
    return static_cast<int>(std::lround(opacity * 100.0));
}

} // namespace AnimaEngine

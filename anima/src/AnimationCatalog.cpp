#include "../include/AnimationCatalog.h"
#include <algorithm>
#include <filesystem>

namespace AnimaEngine {

AnimationCatalog::AnimationCatalog(std::vector<std::string> paths) : paths_(std::move(paths)) {}

bool AnimationCatalog::Add(const std::vector<std::string>& files) {
    bool added = false;
    for (const auto& file : files) {
        if (file.empty() || Contains(file)) {
            continue;
        }
        paths_.push_back(file);
        added = true;
    }
    return added;
}

std::optional<int> AnimationCatalog::RemoveAt(int index) {
    if (!IsValidIndex(index)) {
        return std::nullopt;
    }

    paths_.erase(paths_.begin() + index);

    if (paths_.empty()) {
        return -1;
    }
    return std::min(index, static_cast<int>(paths_.size()) - 1);
}

std::optional<std::string> AnimationCatalog::At(int index) const {
    if (!IsValidIndex(index)) {
        return std::nullopt;
    }
    return paths_[index];
}

std::vector<std::string> AnimationCatalog::DisplayNames() const {
    std::vector<std::string> names;
    names.reserve(paths_.size());
    for (const auto& path : paths_) {
        names.push_back(DisplayName(path));
    }
    return names;
}

bool AnimationCatalog::IsValidIndex(int index) const {
    return index >= 0 && index < static_cast<int>(paths_.size());
}

bool AnimationCatalog::Contains(const std::string& path) const {
    return std::find(paths_.begin(), paths_.end(), path) != paths_.end();
}

std::string AnimationCatalog::DisplayName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

} // namespace AnimaEngine

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace AnimaEngine {

/**
 * @brief Editable list of animation paths shown by the selector
 *
 * Removing an entry only forgets it; files on disk are never touched.
 */
class AnimationCatalog {
public:
    AnimationCatalog() = default;
    explicit AnimationCatalog(std::vector<std::string> paths);

    /**
     * @brief Append files not already listed
     * @return true if at least one path was added
     */
    bool Add(const std::vector<std::string>& files);

    /**
     * @brief Remove the entry at index
     * @return Row to select afterwards (-1 if the list is now empty),
     *         or std::nullopt if index was out of range
     */
    std::optional<int> RemoveAt(int index);

    std::optional<std::string> At(int index) const;

    /**
     * @brief File name component of every path, in list order
     */
    std::vector<std::string> DisplayNames() const;

    bool IsValidIndex(int index) const;
    bool Contains(const std::string& path) const;

    const std::vector<std::string>& Paths() const { return paths_; }
    size_t Size() const { return paths_.size(); }
    bool Empty() const { return paths_.empty(); }

    static std::string DisplayName(const std::string& path);

private:
    std::vector<std::string> paths_;
};

} // namespace AnimaEngine

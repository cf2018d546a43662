#pragma once

#include <string>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

namespace AnimaEngine {

/**
 * @class ConfigStore
 * @brief Flat JSON key-value store persisted next to the executable
 *
 * Keys:
 * - "last_gif": last animation applied to a pet
 * - "pos":      [x, y] of the main pet
 * - "opacity":  opacity fraction shared by all pets
 *
 * Loading is best effort: a missing or corrupt file gives an empty store.
 * Keys with an unexpected type are treated as absent. Unknown keys are
 * kept and written back on save.
 */
class ConfigStore {
public:
    explicit ConfigStore(std::string path);

    /**
     * @brief Read the file, replacing current contents
     * @return true if a valid JSON object was read
     */
    bool Load();

    /**
     * @brief Write the current contents with 2-space indentation
     * @return false if the file could not be written
     */
    bool Save() const;

    std::optional<std::string> LastAnimation() const;
    void SetLastAnimation(const std::string& path);

    std::optional<std::pair<int, int>> Position() const;
    void SetPosition(int x, int y);

    /**
     * @brief Stored opacity clamped to [MIN_OPACITY, MAX_OPACITY], 1.0 if absent
     */
    double Opacity() const;
    void SetOpacity(double opacity);

    const std::string& GetPath() const { return path_; }
    const nlohmann::json& Data() const { return data_; }

    static double ClampOpacity(double opacity);
    static int OpacityToPercent(double opacity);

private:
    std::string path_;
    nlohmann::json data_ = nlohmann::json::object();
};

} // namespace AnimaEngine

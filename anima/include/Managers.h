#pragma once

#include <SDL.h>
#include <sol/sol.hpp>
#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <optional>
#include "Utils.h"
#include "Pet.h"

namespace AnimaEngine {

// Usable desktop area pets are placed in
struct ScreenArea {
    int width = 0;
    int height = 0;
};

/**
 * @brief Pet Manager - owns the live pets (between MIN_PETS and MAX_PETS)
 */
class PetManager {
public:
    /**
     * @param idleAnimation Idle animation for every pet, empty to disable idling
     */
    explicit PetManager(std::string idleAnimation);
    ~PetManager() = default;

    // Disable copy
    PetManager(const PetManager&) = delete;
    PetManager& operator=(const PetManager&) = delete;

    /**
     * @brief Create the startup pet, the only one whose position is persisted
     * @return nullptr if the window could not be created
     */
    Pet* CreateMainPet(const std::string& animation, Point position, double targetOpacity);

    /**
     * @brief Spawn another pet next to the first one
     * @param defaultAnimation Used when no pet exists to copy from
     * @return nullptr if the roster is full or the window failed
     */
    Pet* AddPet(const std::string& defaultAnimation, double opacity, const ScreenArea& screen);

    /**
     * @brief Close a pet; the last remaining pet is never removed
     */
    bool RemovePet(int id);

    Pet* Find(int id);
    Pet* FindByWindowId(Uint32 windowId);
    Pet* First();

    void ApplyOpacity(double opacity);

    /**
     * @brief Advance every pet
     * @return Ids of pets that went idle during this update
     */
    std::vector<int> Update(int deltaMs);

    void Render();

    size_t Count() const { return pets_.size(); }
    bool CanAdd() const { return CanAddPet(pets_.size()); }
    bool CanRemove() const { return CanRemovePet(pets_.size()); }
    const std::vector<std::unique_ptr<Pet>>& Pets() const { return pets_; }

    static bool CanAddPet(size_t count);
    static bool CanRemovePet(size_t count);

    static Point DefaultMainPosition(const ScreenArea& screen);

    /**
     * @brief Keep a saved main pet position fully on screen
     */
    static Point ClampToScreen(Point position, const ScreenArea& screen);

    /**
     * @brief Where the (count + 1)th pet appears
     * @param firstPosition Position of the first pet, if any
     */
    static Point SpawnPosition(size_t count, std::optional<Point> firstPosition, const ScreenArea& screen);

private:
    std::vector<std::unique_ptr<Pet>> pets_;
    std::string idleAnimation_;
    int nextId_ = 1;
};

/**
 * @brief Script Runner - Executes the optional Lua behavior script
 * Runs on Main Thread (called from main loop)
 *
 * Lua only reaches the application through the event queue, so a script
 * can do exactly what the menus and the selector can.
 */
class ScriptRunner {
public:
    ScriptRunner() = default;
    ~ScriptRunner() = default;

    /**
     * @brief Initialize Lua state and bind C++ functions
     * @param eventQueue Queue receiving events sent from Lua
     */
    bool Init(EventQueue<AppEvent>* eventQueue);

    /**
     * @brief Execute Lua script
     * @param code Lua code to execute
     * @return true if execution succeeded
     */
    bool RunScript(const std::string& code);

    /**
     * @brief Load and execute Lua file
     */
    bool LoadFile(const std::string& path);

    /**
     * @brief Call a global Lua function if the script defines it
     * @return true if the hook exists and ran without error
     */
    template<typename... Args>
    bool CallHook(const std::string& name, Args&&... args) {
        if (!initialized_) {
            return false;
        }

        sol::optional<sol::protected_function> hook = lua_[name];
        if (!hook) {
            return false;
        }

        sol::protected_function_result result = (*hook)(std::forward<Args>(args)...);
        if (!result.valid()) {
            sol::error err = result;
            std::cerr << "[ScriptRunner] " << name << " failed: " << err.what() << std::endl;
            return false;
        }
        return true;
    }

    bool IsInitialized() const { return initialized_; }

    /**
     * @brief Get Lua state (for advanced operations)
     */
    sol::state& GetLuaState() { return lua_; }

private:
    /**
     * @brief Bind C++ functions to Lua
     */
    void BindFunctions();

    void Push(AppEvent event);

    sol::state lua_;
    bool initialized_ = false;
    EventQueue<AppEvent>* eventQueue_ = nullptr;
};

/**
 * @brief Local time formatted as YYYY-mm-dd HH:MM:SS
 */
std::string CurrentTimeString();

} // namespace AnimaEngine

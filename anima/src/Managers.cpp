#include "../include/Managers.h"
#include "../include/Settings.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace AnimaEngine {

// ============================================================================
// PetManager Implementation
// ============================================================================

PetManager::PetManager(std::string idleAnimation) : idleAnimation_(std::move(idleAnimation)) {}

Pet* PetManager::CreateMainPet(const std::string& animation, Point position, double targetOpacity) {
    auto pet = std::make_unique<Pet>(nextId_++, animation, idleAnimation_, true);
    if (!pet->Init(position.x, position.y)) {
        std::cerr << "[PetManager] Failed to create main pet" << std::endl;
        return nullptr;
    }

    pet->StartFadeIn(targetOpacity);
    pet->Show();
    pet->Raise();

    pets_.push_back(std::move(pet));
    return pets_.back().get();
}

Pet* PetManager::AddPet(const std::string& defaultAnimation, double opacity, const ScreenArea& screen) {
    if (!CanAdd()) {
        std::cout << "[PetManager] Already " << pets_.size() << " pets, not adding" << std::endl;
        return nullptr;
    }

    std::string animation = defaultAnimation;
    std::optional<Point> firstPosition;
    if (!pets_.empty()) {
        animation = pets_.front()->GetState().ActiveAnimation();
        firstPosition = pets_.front()->GetPosition();
    }

    Point position = SpawnPosition(pets_.size(), firstPosition, screen);

    auto pet = std::make_unique<Pet>(nextId_++, animation, idleAnimation_, false);
    if (!pet->Init(position.x, position.y)) {
        std::cerr << "[PetManager] Failed to create pet" << std::endl;
        return nullptr;
    }

    pet->SetOpacity(opacity);
    pet->Show();
    pet->Raise();

    pets_.push_back(std::move(pet));
    std::cout << "[PetManager] Pet count: " << pets_.size() << std::endl;
    return pets_.back().get();
}

bool PetManager::RemovePet(int id) {
    auto it = std::find_if(pets_.begin(), pets_.end(),
                           [id](const std::unique_ptr<Pet>& pet) { return pet->GetId() == id; });
    if (it == pets_.end()) {
        return false;
    }
    if (!CanRemove()) {
        std::cout << "[PetManager] Keeping the last pet" << std::endl;
        return false;
    }

    pets_.erase(it);
    std::cout << "[PetManager] Removed pet #" << id << ", pet count: " << pets_.size() << std::endl;
    return true;
}

Pet* PetManager::Find(int id) {
    for (auto& pet : pets_) {
        if (pet->GetId() == id) {
            return pet.get();
        }
    }
    return nullptr;
}

Pet* PetManager::FindByWindowId(Uint32 windowId) {
    for (auto& pet : pets_) {
        if (pet->GetWindowId() == windowId) {
            return pet.get();
        }
    }
    return nullptr;
}

Pet* PetManager::First() {
    return pets_.empty() ? nullptr : pets_.front().get();
}

void PetManager::ApplyOpacity(double opacity) {
    for (auto& pet : pets_) {
        pet->SetOpacity(opacity);
    }
}

std::vector<int> PetManager::Update(int deltaMs) {
    std::vector<int> wentIdle;
    for (auto& pet : pets_) {
        if (pet->Update(deltaMs)) {
            wentIdle.push_back(pet->GetId());
        }
    }
    return wentIdle;
}

void PetManager::Render() {
    for (auto& pet : pets_) {
        pet->Render();
    }
}

bool PetManager::CanAddPet(size_t count) {
    return count < MAX_PETS;
}

bool PetManager::CanRemovePet(size_t count) {
    return count > MIN_PETS;
}

Point PetManager::DefaultMainPosition(const ScreenArea& screen) {
    return {DEFAULT_MARGIN_X, screen.height - PET_SIZE - DEFAULT_MARGIN_BOTTOM};
}

Point PetManager::ClampToScreen(Point position, const ScreenArea& screen) {
    // max() first so a screen smaller than a pet pins it to the origin
    position.x = std::max(0, std::min(position.x, screen.width - PET_SIZE));
    position.y = std::max(0, std::min(position.y, screen.height - PET_SIZE));
    return position;
}

Point PetManager::SpawnPosition(size_t count, std::optional<Point> firstPosition, const ScreenArea& screen) {
    Point base = firstPosition ? *firstPosition : DefaultMainPosition(screen);
    int offset = static_cast<int>(count) * (PET_SIZE + PET_SPAWN_GAP);
    return {std::min(base.x + offset, screen.width - PET_SIZE), base.y};
}

// ============================================================================
// ScriptRunner Implementation
// ============================================================================

bool ScriptRunner::Init(EventQueue<AppEvent>* eventQueue) {
    eventQueue_ = eventQueue;

    try {
        lua_.open_libraries(sol::lib::base, sol::lib::string, sol::lib::math,
                           sol::lib::table);

        BindFunctions();

        initialized_ = true;
        std::cout << "[ScriptRunner] Initialized" << std::endl;
        return true;
    } catch (const sol::error& e) {
        std::cerr << "[ScriptRunner] Init error: " << e.what() << std::endl;
        return false;
    }
}

void ScriptRunner::BindFunctions() {
    // Create pet namespace
    auto pet = lua_["pet"].get_or_create<sol::table>();

    pet["log"] = [](const std::string& message) {
        std::cout << "[Lua] " << message << std::endl;
    };

    pet["getTime"] = []() {
        return CurrentTimeString();
    };

    pet["setAnimation"] = [this](int id, const std::string& path) {
        Push(AppEvent(EventType::APPLY_ANIMATION, id, path));
    };

    pet["setOpacity"] = [this](int percent) {
        Push(AppEvent::Opacity(percent));
    };

    pet["addPet"] = [this]() {
        Push(AppEvent(EventType::ADD_PET));
    };

    pet["removePet"] = [this](int id) {
        Push(AppEvent(EventType::REMOVE_PET, id));
    };

    pet["toggleLock"] = [this](int id) {
        Push(AppEvent(EventType::TOGGLE_LOCK, id));
    };

    pet["showSelector"] = [this]() {
        Push(AppEvent(EventType::SHOW_SELECTOR));
    };

    pet["hideSelector"] = [this]() {
        Push(AppEvent(EventType::HIDE_SELECTOR));
    };

    pet["quit"] = [this]() {
        Push(AppEvent(EventType::SHUTDOWN));
    };
}

void ScriptRunner::Push(AppEvent event) {
    if (!eventQueue_) {
        std::cerr << "[ScriptRunner] No event queue, dropping " << EventTypeName(event.type) << std::endl;
        return;
    }
    eventQueue_->push(std::move(event));
}

bool ScriptRunner::RunScript(const std::string& code) {
    if (!initialized_) {
        std::cerr << "[ScriptRunner] Not initialized" << std::endl;
        return false;
    }

    try {
        lua_.script(code);
        return true;
    } catch (const sol::error& e) {
        std::cerr << "[ScriptRunner] Execution error: " << e.what() << std::endl;
        return false;
    }
}

bool ScriptRunner::LoadFile(const std::string& path) {
    if (!initialized_) {
        std::cerr << "[ScriptRunner] Not initialized" << std::endl;
        return false;
    }

    try {
        lua_.script_file(path);
        std::cout << "[ScriptRunner] Loaded file: " << path << std::endl;
        return true;
    } catch (const sol::error& e) {
        std::cerr << "[ScriptRunner] File load error: " << e.what() << std::endl;
        return false;
    }
}

std::string CurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace AnimaEngine

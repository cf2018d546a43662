#include "Managers.h"
#include "Settings.h"
#include <gtest/gtest.h>

namespace AnimaEngine {

    namespace {
    const ScreenArea kScreen{1920, 1040};
    }

    TEST(PetManagerRules, AddAllowedBelowMaximum) {
        EXPECT_TRUE(PetManager::CanAddPet(0));
        EXPECT_TRUE(PetManager::CanAddPet(MAX_PETS - 1));
        EXPECT_FALSE(PetManager::CanAddPet(MAX_PETS));
    }

    TEST(PetManagerRules, LastPetCannotBeRemoved) {
        EXPECT_FALSE(PetManager::CanRemovePet(1));
        EXPECT_TRUE(PetManager::CanRemovePet(2));
        EXPECT_TRUE(PetManager::CanRemovePet(MAX_PETS));
    }

    TEST(PetManagerGeometry, DefaultMainPositionIsBottomLeft) {
        EXPECT_EQ(PetManager::DefaultMainPosition(kScreen), (Point{30, 1040 - PET_SIZE - 50}));
    }

    TEST(PetManagerGeometry, SpawnNextToFirstPet) {
        Point first{30, 740};
        EXPECT_EQ(PetManager::SpawnPosition(1, first, kScreen), (Point{300, 740}));
        EXPECT_EQ(PetManager::SpawnPosition(2, first, kScreen), (Point{570, 740}));
    }

    TEST(PetManagerGeometry, SpawnStaysOnScreen) {
        Point first{1500, 100};
        EXPECT_EQ(PetManager::SpawnPosition(1, first, kScreen), (Point{1920 - PET_SIZE, 100}));
    }

    TEST(PetManagerGeometry, SpawnWithoutPetsUsesDefault) {
        EXPECT_EQ(PetManager::SpawnPosition(0, std::nullopt, kScreen), PetManager::DefaultMainPosition(kScreen));
    }

    TEST(PetManagerGeometry, ClampKeepsPetVisible) {
        EXPECT_EQ(PetManager::ClampToScreen({5000, -20}, kScreen), (Point{1670, 0}));
        EXPECT_EQ(PetManager::ClampToScreen({100, 2000}, kScreen), (Point{100, 790}));
        EXPECT_EQ(PetManager::ClampToScreen({400, 300}, kScreen), (Point{400, 300}));
    }

    TEST(PetManagerGeometry, TinyScreenPinsToOrigin) {
        EXPECT_EQ(PetManager::ClampToScreen({50, 50}, ScreenArea{200, 200}), (Point{0, 0}));
    }

    TEST(PetManager, StartsEmpty) {
        PetManager manager("");
        EXPECT_EQ(manager.Count(), 0u);
        EXPECT_EQ(manager.First(), nullptr);
        EXPECT_EQ(manager.Find(1), nullptr);
        EXPECT_FALSE(manager.RemovePet(1));
        EXPECT_TRUE(manager.Update(100).empty());
    }

} // namespace AnimaEngine

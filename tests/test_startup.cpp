#include "App.h"
#include "Settings.h"
#include "test_helpers.hpp"

namespace AnimaEngine {

    // Startup resolution reads files relative to the working directory
    class StartupTest : public test::TempDirTest {
    protected:
        void SetUp() override {
            test::TempDirTest::SetUp();
            previous_ = std::filesystem::current_path();
            std::filesystem::current_path(dir_);
        }

        void TearDown() override {
            std::filesystem::current_path(previous_);
            test::TempDirTest::TearDown();
        }

        std::filesystem::path previous_;
    };

    TEST_F(StartupTest, SavedAnimationUsedWhenPresent) {
        std::filesystem::create_directories("gifs");
        WriteFile("gifs/cat.gif", "GIF89a");

        ConfigStore config(PathOf("config.json"));
        config.SetLastAnimation("gifs/cat.gif");

        EXPECT_EQ(ResolveStartAnimation(config), "gifs/cat.gif");
        EXPECT_EQ(config.LastAnimation().value_or(""), "gifs/cat.gif");
    }

    TEST_F(StartupTest, MissingSavedAnimationFallsBackToDefault) {
        ConfigStore config(PathOf("config.json"));
        config.SetLastAnimation("gifs/deleted.gif");

        EXPECT_EQ(ResolveStartAnimation(config), DEFAULT_ANIMATION);
        EXPECT_EQ(config.LastAnimation().value_or(""), DEFAULT_ANIMATION);
    }

    TEST_F(StartupTest, NoSavedAnimationWritesDefault) {
        ConfigStore config(PathOf("config.json"));

        EXPECT_EQ(ResolveStartAnimation(config), DEFAULT_ANIMATION);
        EXPECT_EQ(config.LastAnimation().value_or(""), DEFAULT_ANIMATION);
    }

    TEST_F(StartupTest, DefaultPositionIsStored) {
        ConfigStore config(PathOf("config.json"));
        ScreenArea screen{1920, 1040};

        Point position = ResolveMainPosition(config, screen);
        EXPECT_EQ(position, (Point{30, 740}));

        ASSERT_TRUE(config.Position().has_value());
        EXPECT_EQ(config.Position()->first, 30);
        EXPECT_EQ(config.Position()->second, 740);
    }

    TEST_F(StartupTest, SavedPositionIsClampedButNotRewritten) {
        ConfigStore config(PathOf("config.json"));
        config.SetPosition(3000, 200);
        ScreenArea screen{1920, 1040};

        EXPECT_EQ(ResolveMainPosition(config, screen), (Point{1670, 200}));
        EXPECT_EQ(config.Position()->first, 3000);
    }

    TEST_F(StartupTest, IdleAnimationOnlyWhenFileExists) {
        EXPECT_EQ(ResolveIdleAnimation(), "");

        WriteFile(IDLE_ANIMATION, "GIF89a");
        EXPECT_EQ(ResolveIdleAnimation(), IDLE_ANIMATION);
    }

} // namespace AnimaEngine

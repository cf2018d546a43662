#include "Managers.h"
#include "test_helpers.hpp"

namespace AnimaEngine {

    class ScriptRunnerTest : public test::TempDirTest {
    protected:
        void SetUp() override {
            test::TempDirTest::SetUp();
            ASSERT_TRUE(runner_.Init(&queue_));
        }

        std::vector<AppEvent> Drain() {
            std::vector<AppEvent> events;
            while (auto event = queue_.tryPop()) {
                events.push_back(std::move(*event));
            }
            return events;
        }

        EventQueue<AppEvent> queue_;
        ScriptRunner runner_;
    };

    TEST_F(ScriptRunnerTest, PetApiQueuesEvents) {
        ASSERT_TRUE(runner_.RunScript(R"(
            pet.setAnimation(2, "gifs/cat.gif")
            pet.setOpacity(45)
            pet.addPet()
            pet.removePet(3)
            pet.toggleLock(1)
            pet.showSelector()
            pet.hideSelector()
            pet.quit()
        )"));

        auto events = Drain();
        ASSERT_EQ(events.size(), 8u);

        EXPECT_EQ(events[0].type, EventType::APPLY_ANIMATION);
        EXPECT_EQ(events[0].petId, 2);
        EXPECT_EQ(events[0].payload, "gifs/cat.gif");

        EXPECT_EQ(events[1].type, EventType::SET_OPACITY);
        EXPECT_EQ(events[1].value, 45);

        EXPECT_EQ(events[2].type, EventType::ADD_PET);

        EXPECT_EQ(events[3].type, EventType::REMOVE_PET);
        EXPECT_EQ(events[3].petId, 3);

        EXPECT_EQ(events[4].type, EventType::TOGGLE_LOCK);
        EXPECT_EQ(events[4].petId, 1);

        EXPECT_EQ(events[5].type, EventType::SHOW_SELECTOR);
        EXPECT_EQ(events[6].type, EventType::HIDE_SELECTOR);
        EXPECT_EQ(events[7].type, EventType::SHUTDOWN);
    }

    TEST_F(ScriptRunnerTest, SyntaxErrorIsReported) {
        EXPECT_FALSE(runner_.RunScript("pet.addPet("));
        EXPECT_TRUE(queue_.empty());
    }

    TEST_F(ScriptRunnerTest, RuntimeErrorIsReported) {
        EXPECT_FALSE(runner_.RunScript("error('boom')"));
    }

    TEST_F(ScriptRunnerTest, HooksRunWithArguments) {
        ASSERT_TRUE(runner_.RunScript(R"(
            function onClick(id)
                pet.toggleLock(id)
            end
        )"));

        EXPECT_TRUE(runner_.CallHook("onClick", 7));
        auto events = Drain();
        ASSERT_EQ(events.size(), 1u);
        EXPECT_EQ(events[0].type, EventType::TOGGLE_LOCK);
        EXPECT_EQ(events[0].petId, 7);
    }

    TEST_F(ScriptRunnerTest, MissingHookIsSkipped) {
        EXPECT_FALSE(runner_.CallHook("onIdle", 1));
    }

    TEST_F(ScriptRunnerTest, FailingHookIsReported) {
        ASSERT_TRUE(runner_.RunScript("function onStart() error('bad start') end"));
        EXPECT_FALSE(runner_.CallHook("onStart"));
    }

    TEST_F(ScriptRunnerTest, LoadFileRunsScript) {
        std::string path = WriteFile("pet.lua", "function onStart() pet.addPet() end\n");

        ASSERT_TRUE(runner_.LoadFile(path));
        EXPECT_TRUE(runner_.CallHook("onStart"));
        EXPECT_EQ(queue_.size(), 1u);
    }

    TEST_F(ScriptRunnerTest, LoadMissingFileFails) {
        EXPECT_FALSE(runner_.LoadFile(PathOf("nope.lua")));
    }

    TEST_F(ScriptRunnerTest, GetTimeIsFormatted) {
        ASSERT_TRUE(runner_.RunScript("stamp = pet.getTime()"));
        std::string stamp = runner_.GetLuaState()["stamp"];
        ASSERT_EQ(stamp.size(), 19u);
        EXPECT_EQ(stamp[4], '-');
        EXPECT_EQ(stamp[10], ' ');
        EXPECT_EQ(stamp[13], ':');
    }

    TEST(ScriptRunner, RefusesToRunBeforeInit) {
        ScriptRunner runner;
        EXPECT_FALSE(runner.IsInitialized());
        EXPECT_FALSE(runner.RunScript("x = 1"));
        EXPECT_FALSE(runner.CallHook("onStart"));
    }

} // namespace AnimaEngine

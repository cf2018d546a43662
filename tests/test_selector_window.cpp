#include "SelectorWindow.h"
#include "Settings.h"
#include <gtest/gtest.h>
#include <gtk/gtk.h>
#include <memory>

namespace AnimaEngine {

    // Needs a display; skipped on headless machines
    class SelectorWindowTest : public ::testing::Test {
    protected:
        void SetUp() override {
            static const bool gtkReady = gtk_init_check(nullptr, nullptr);
            if (!gtkReady) {
                GTEST_SKIP() << "No display for GTK";
            }

            selector_ = std::make_unique<SelectorWindow>(
                &queue_, std::vector<std::string>{"gifs/a.gif", "gifs/b.gif"});
            ASSERT_TRUE(selector_->Init(80, 1));
        }

        EventQueue<AppEvent> queue_;
        std::unique_ptr<SelectorWindow> selector_;
    };

    TEST_F(SelectorWindowTest, StartsAtConfiguredOpacity) {
        EXPECT_EQ(selector_->GetOpacityPercent(), 80);
        EXPECT_TRUE(queue_.empty());
    }

    TEST_F(SelectorWindowTest, SetOpacityPercentDoesNotQueueChange) {
        selector_->SetOpacityPercent(45);

        EXPECT_EQ(selector_->GetOpacityPercent(), 45);
        EXPECT_TRUE(queue_.empty());
    }

    TEST_F(SelectorWindowTest, AddFilesAppendsNewPathsOnly) {
        selector_->AddFiles({"gifs/c.gif", "gifs/a.gif", "gifs/c.gif"});

        EXPECT_EQ(selector_->GetCatalog().Paths(),
                  (std::vector<std::string>{"gifs/a.gif", "gifs/b.gif", "gifs/c.gif"}));
        EXPECT_TRUE(queue_.empty());
    }

    TEST_F(SelectorWindowTest, CurrentPetCanBeRetargeted) {
        EXPECT_EQ(selector_->GetCurrentPet(), 1);
        selector_->SetCurrentPet(3);
        EXPECT_EQ(selector_->GetCurrentPet(), 3);
    }

} // namespace AnimaEngine

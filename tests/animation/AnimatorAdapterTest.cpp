#include "animation/AnimatorAdapter.h"
#include "common/LogCapture.h"
#include <gtest/gtest.h>
#include <set>
#include <vector>

using namespace FSE;

class AnimatorAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        animator = std::make_unique<CallbackAnimator>(
            [this](const AnimationRequest &request) { played.push_back(request); },
            [this](const std::string &name) { return library.count(name) > 0; });
    }

    std::set<std::string> library{"idle", "run", "jump"};
    std::vector<AnimationRequest> played;
    std::unique_ptr<CallbackAnimator> animator;
};

TEST_F(AnimatorAdapterTest, ForwardsKnownAnimation) {
    animator->playAnimation("run", 1.25f, 0.5f, true);

    ASSERT_EQ(played.size(), 1u);
    EXPECT_EQ(played[0].name, "run");
    EXPECT_FLOAT_EQ(played[0].speed, 1.25f);
    EXPECT_FLOAT_EQ(played[0].blend, 0.5f);
    EXPECT_TRUE(played[0].loop);
}

TEST_F(AnimatorAdapterTest, MissingAnimationIsWarnedAndSkipped) {
    FSE::Test::LogCapture logs;
    animator->playAnimation("dance", 1.0f, 0.0f, false, [] {});

    EXPECT_TRUE(played.empty());
    EXPECT_FALSE(animator->hasPendingCallback("dance"));
    EXPECT_TRUE(logs.contains(LogLevel::Warn, "'dance'"));
}

TEST_F(AnimatorAdapterTest, EmptyNameIsIgnored) {
    animator->playAnimation("", 1.0f, 0.0f, false);
    EXPECT_TRUE(played.empty());
}

TEST_F(AnimatorAdapterTest, FinishCallbackFiresOnce) {
    int finished = 0;
    animator->playAnimation("jump", 1.0f, 0.0f, false, [&] { ++finished; });
    EXPECT_TRUE(animator->hasPendingCallback("jump"));

    EXPECT_TRUE(animator->notifyFinished("jump"));
    EXPECT_FALSE(animator->notifyFinished("jump"));
    EXPECT_EQ(finished, 1);
}

TEST_F(AnimatorAdapterTest, LaterRequestReplacesPendingCallback) {
    int first = 0;
    int second = 0;
    animator->playAnimation("idle", 1.0f, 0.0f, true, [&] { ++first; });
    animator->playAnimation("idle", 1.0f, 0.0f, true, [&] { ++second; });

    animator->notifyFinished("idle");
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(CallbackAnimatorTest, WithoutLookupEveryNameIsPlayable) {
    int calls = 0;
    CallbackAnimator animator([&](const AnimationRequest &) { ++calls; });

    animator.playAnimation("anything", 1.0f, 0.0f, false);
    EXPECT_EQ(calls, 1);
}

#include "runtime/StateMachine.h"
#include "runtime/StateMachineBuilder.h"
#include "common/LogCapture.h"
#include "common/TestStates.h"
#include "mocks/MockAnimator.h"
#include "mocks/MockObserver.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace FSE;
using FSE::Test::Move;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class CollaboratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        animator = std::make_shared<NiceMock<FSE::Test::MockAnimator>>();
        machine = StateMachineBuilder().withIdFormatter(FSE::Test::moveName).withAnimator(animator).build();
        machine->addState(Move::Idle);
        machine->addState(Move::Run);
    }

    std::shared_ptr<NiceMock<FSE::Test::MockAnimator>> animator;
    std::unique_ptr<StateMachine> machine;
};

TEST_F(CollaboratorTest, EnteringStatePlaysItsAnimation) {
    machine->getState(Move::Run)->setAnimationData("run_loop", 1.5f, 0.25f, true);

    EXPECT_CALL(*animator, playAnimation("run_loop", 1.5f, 0.25f, true, _));
    ASSERT_TRUE(machine->forceChangeState(Move::Run));
}

TEST_F(CollaboratorTest, StateWithoutAnimationDoesNotTouchAnimator) {
    EXPECT_CALL(*animator, playAnimation(_, _, _, _, _)).Times(0);
    ASSERT_TRUE(machine->forceChangeState(Move::Run));
}

TEST_F(CollaboratorTest, FinishCallbackReachesAnimator) {
    int finished = 0;
    machine->getState(Move::Run)->setAnimationData("run_start", 1.0f, 0.0f, false, [&] { ++finished; });

    EXPECT_CALL(*animator, playAnimation("run_start", _, _, false, _))
        .WillOnce(Invoke([](const std::string &, float, float, bool, std::function<void()> onFinished) {
            ASSERT_TRUE(onFinished);
            onFinished();
        }));

    ASSERT_TRUE(machine->forceChangeState(Move::Run));
    EXPECT_EQ(finished, 1);
}

TEST_F(CollaboratorTest, MissingAnimatorIsNotAnError) {
    FSE::Test::LogCapture logs;
    machine->setAnimator(nullptr);
    machine->getState(Move::Run)->setAnimationData("run_loop");

    EXPECT_TRUE(machine->forceChangeState(Move::Run));
    EXPECT_EQ(logs.count(LogLevel::Error), 0);
}

TEST_F(CollaboratorTest, ThrowingObserverDoesNotAbortStateChange) {
    FSE::Test::LogCapture logs;
    FSE::Test::MockObserver throwing;
    FSE::Test::MockObserver healthy;
    machine->addObserver(&throwing);
    machine->addObserver(&healthy);

    EXPECT_CALL(throwing, onStateChanged(_, _)).WillOnce(Invoke([](const std::optional<StateId> &, StateId) {
        throw std::runtime_error("observer failure");
    }));
    EXPECT_CALL(healthy, onStateChanged(_, StateId(Move::Run)));

    EXPECT_TRUE(machine->forceChangeState(Move::Run));
    EXPECT_TRUE(machine->isCurrentState(Move::Run));
    EXPECT_TRUE(logs.contains(LogLevel::Error, "observer failure"));
}

TEST_F(CollaboratorTest, ObserverCanUnregisterDuringNotification) {
    FSE::Test::MockObserver observer;
    machine->addObserver(&observer);

    EXPECT_CALL(observer, onStateChanged(_, _)).WillOnce(Invoke([&](const std::optional<StateId> &, StateId) {
        machine->removeObserver(&observer);
    }));

    ASSERT_TRUE(machine->forceChangeState(Move::Run));
    ASSERT_TRUE(machine->forceChangeState(Move::Idle));
}

TEST_F(CollaboratorTest, ObserverRegisteredOnce) {
    FSE::Test::MockObserver observer;
    machine->addObserver(&observer);
    machine->addObserver(&observer);

    EXPECT_CALL(observer, onStateChanged(_, _)).Times(1);
    ASSERT_TRUE(machine->forceChangeState(Move::Run));
}

TEST(StateMachineBuilderTest, AppliesConfiguration) {
    FSE::Test::MockObserver observer;
    auto machine = StateMachineBuilder()
                       .withObserver(&observer)
                       .withIdFormatter(FSE::Test::moveName)
                       .withEvaluatorPoolSize(3)
                       .build();

    EXPECT_EQ(machine->getEvaluatorPool().available(), 3u);
    EXPECT_EQ(machine->formatId(Move::Jump), "Jump");
    EXPECT_EQ(machine->getAnimator(), nullptr);

    machine->addState(Move::Idle);
    machine->addState(Move::Jump);
    EXPECT_CALL(observer, onStateChanged(std::optional<StateId>(Move::Idle), StateId(Move::Jump)));
    ASSERT_TRUE(machine->forceChangeState(Move::Jump));
}

#include "animation/AnimatorAdapter.h"
#include "runtime/StateMachineBuilder.h"
#include "common/TestSignal.h"
#include "common/TestStates.h"
#include "mocks/MockObserver.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace FSE;
using FSE::Test::Move;
using ::testing::_;
using ::testing::NiceMock;

/**
 * @brief Platformer character driven frame by frame
 *
 * Idle -> Run on movement input, any state -> Jump on jump input, and Jump
 * falls back to Idle through its timeout.
 */
class CharacterControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        animator = std::make_shared<CallbackAnimator>(
            [this](const AnimationRequest &request) { animations.push_back(request.name); });

        machine = StateMachineBuilder().withIdFormatter(FSE::Test::moveName).withAnimator(animator).build();
        machine->addObserver(&observer);

        machine->addState(Move::Idle);
        machine->addState(Move::Run, nullptr, nullptr, nullptr, 0.2f);
        machine->addState(Move::Jump, nullptr, nullptr, nullptr, 0.0f, 0.5f);

        machine->getState(Move::Run)->setAnimationData("run", 1.0f, 0.1f, true).addTag("grounded");
        machine->getState(Move::Idle)->setAnimationData("idle", 1.0f, 0.1f, true).addTag("grounded");
        machine->getState(Move::Jump)->setAnimationData("jump");

        machine->addTransition(Move::Idle, Move::Run, [this] { return moveInput; })->setPriority(1);
        jump = machine->addGlobalTransition(Move::Jump, [this] { return jumpInput; });
        jump->setPriority(10);
    }

    void tick(double delta) {
        machine->update(TickKind::Physics, delta);
    }

    bool moveInput = false;
    bool jumpInput = false;
    std::vector<std::string> animations;
    FSE::Test::TestSignal attackButton;
    std::shared_ptr<CallbackAnimator> animator;
    NiceMock<FSE::Test::MockObserver> observer;
    std::unique_ptr<StateMachine> machine;
    StateMachine::TransitionPtr jump;
};

TEST_F(CharacterControllerTest, RunsJumpsAndLandsThroughTimeout) {
    ASSERT_TRUE(machine->isCurrentState(Move::Idle));

    moveInput = true;
    tick(0.1);
    EXPECT_TRUE(machine->isCurrentState(Move::Run));
    EXPECT_TRUE(machine->isInStateWithTag("grounded"));

    // Run's minimum dwell holds the global jump back
    jumpInput = true;
    tick(0.1);
    EXPECT_TRUE(machine->isCurrentState(Move::Run));

    tick(0.15);
    EXPECT_TRUE(machine->isCurrentState(Move::Jump));
    EXPECT_FALSE(machine->isInStateWithTag("grounded"));

    jumpInput = false;
    moveInput = false;
    EXPECT_CALL(observer, onStateTimeout(StateId(Move::Jump)));
    tick(0.25);
    EXPECT_TRUE(machine->isCurrentState(Move::Jump));

    tick(0.25);
    EXPECT_TRUE(machine->isCurrentState(Move::Idle));
    EXPECT_TRUE(machine->isPreviousState(Move::Jump));

    EXPECT_EQ(animations, (std::vector<std::string>{"run", "jump", "idle"}));
}

TEST_F(CharacterControllerTest, ForcedInstantJumpIgnoresDwell) {
    jump->forceInstant();

    moveInput = true;
    tick(0.1);
    ASSERT_TRUE(machine->isCurrentState(Move::Run));

    jumpInput = true;
    tick(0.05);
    EXPECT_TRUE(machine->isCurrentState(Move::Jump));
}

TEST_F(CharacterControllerTest, EveryFrameNotifiesAtMostOneTransition) {
    int triggered = 0;
    ON_CALL(observer, onTransitionTriggered(_, _)).WillByDefault([&](StateId, StateId) { ++triggered; });

    moveInput = true;
    jumpInput = true;
    jump->forceInstant();

    // Idle -> Run wins locally, then Run -> Jump globally on the next frame
    tick(0.1);
    EXPECT_EQ(triggered, 1);
    EXPECT_TRUE(machine->isCurrentState(Move::Run));

    tick(0.1);
    EXPECT_EQ(triggered, 2);
    EXPECT_TRUE(machine->isCurrentState(Move::Jump));
}

TEST_F(CharacterControllerTest, AttackButtonSignalDrivesEventTransition) {
    machine->addState(Move::Attack, nullptr, nullptr, nullptr, 0.0f, 0.25f);
    machine->addEventTransition(Move::Idle, Move::Attack, attackButton.subscriber())->setHighestPriority();

    tick(0.1);
    EXPECT_TRUE(machine->isCurrentState(Move::Idle));

    attackButton.emit();
    tick(0.1);
    EXPECT_TRUE(machine->isCurrentState(Move::Attack));

    // Attack restarts into the initial state when its timeout expires
    tick(0.25);
    EXPECT_TRUE(machine->isCurrentState(Move::Idle));

    machine->clearTransitionsFrom(Move::Idle);
    EXPECT_EQ(attackButton.connectionCount(), 0u);
}

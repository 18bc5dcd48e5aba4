#include "model/Transition.h"
#include "common/TestStates.h"
#include <gtest/gtest.h>

using namespace FSE;
using FSE::Test::Move;

namespace {

Transition makeTransition(std::uint64_t index, Transition::Condition condition = nullptr,
                          float minDwellOverride = Constants::NO_DWELL_OVERRIDE) {
    return Transition(StateId(Move::Idle), Move::Run, std::move(condition), minDwellOverride, index);
}

}  // namespace

TEST(TransitionTest, MissingConditionIsAlwaysTrue) {
    EXPECT_TRUE(makeTransition(0).evaluate());
    EXPECT_FALSE(makeTransition(0, [] { return false; }).evaluate());
}

TEST(TransitionTest, GlobalWhenSourceAbsent) {
    Transition global(std::nullopt, Move::Hurt, nullptr, Constants::NO_DWELL_OVERRIDE, 0);
    EXPECT_TRUE(global.isGlobal());
    EXPECT_FALSE(makeTransition(0).isGlobal());
}

TEST(TransitionTest, PriorityIsClampedToZero) {
    Transition transition = makeTransition(0);
    transition.setPriority(-4);
    EXPECT_EQ(transition.getPriority(), 0);

    transition.setHighestPriority();
    EXPECT_EQ(transition.getPriority(), Constants::HIGHEST_PRIORITY);
}

TEST(TransitionTest, PrecedenceIsPriorityThenInsertionOrder) {
    Transition early = makeTransition(0);
    Transition late = makeTransition(1);
    EXPECT_TRUE(Transition::precedes(early, late));
    EXPECT_FALSE(Transition::precedes(late, early));

    late.setPriority(3);
    EXPECT_TRUE(Transition::precedes(late, early));
}

TEST(TransitionTest, DwellOverrideReplacesStateMinimumWhenPositive) {
    EXPECT_FLOAT_EQ(makeTransition(0).effectiveMinDwell(2.0f), 2.0f);
    EXPECT_FLOAT_EQ(makeTransition(0, nullptr, 0.0f).effectiveMinDwell(2.0f), 2.0f);
    EXPECT_FLOAT_EQ(makeTransition(0, nullptr, 0.5f).effectiveMinDwell(2.0f), 0.5f);
}

TEST(TransitionTest, TimeRequirement) {
    Transition transition = makeTransition(0);
    EXPECT_FALSE(transition.isTimeRequirementMet(0.25f, 0.5f));
    EXPECT_TRUE(transition.isTimeRequirementMet(0.5f, 0.5f));

    transition.forceInstant();
    EXPECT_TRUE(transition.isTimeRequirementMet(0.0f, 0.5f));
}

TEST(TransitionTest, TriggeredCallback) {
    int triggered = 0;
    Transition transition = makeTransition(0);
    EXPECT_NO_THROW(transition.notifyTriggered());

    transition.setOnTriggered([&] { ++triggered; });
    transition.notifyTriggered();
    EXPECT_EQ(triggered, 1);
}

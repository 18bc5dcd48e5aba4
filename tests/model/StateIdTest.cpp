#include "model/StateId.h"
#include "common/TestStates.h"
#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <unordered_set>

using namespace FSE;
using FSE::Test::Move;

TEST(StateIdTest, ConvertsImplicitlyFromEnumerations) {
    StateId id = Move::Jump;
    EXPECT_EQ(id.value(), static_cast<StateId::ValueType>(Move::Jump));
    EXPECT_EQ(id.as<Move>(), Move::Jump);
}

TEST(StateIdTest, EqualityAndOrderingFollowUnderlyingValue) {
    EXPECT_EQ(StateId(Move::Run), StateId(1u));
    EXPECT_NE(StateId(Move::Run), StateId(Move::Idle));
    EXPECT_LT(StateId(Move::Idle), StateId(Move::Hurt));
}

TEST(StateIdTest, UsableAsKeyInOrderedAndHashedContainers) {
    std::unordered_set<StateId> hashed{Move::Idle, Move::Run, Move::Idle};
    EXPECT_EQ(hashed.size(), 2u);

    std::map<StateId, int> ordered{{Move::Jump, 2}, {Move::Idle, 0}};
    EXPECT_EQ(ordered.begin()->first, StateId(Move::Idle));
}

TEST(StateIdTest, StreamsAsNumber) {
    std::ostringstream oss;
    oss << StateId(7u);
    EXPECT_EQ(oss.str(), "#7");
}

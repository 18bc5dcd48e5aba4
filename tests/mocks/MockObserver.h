#pragma once

#include "runtime/IStateMachineObserver.h"
#include <gmock/gmock.h>

namespace FSE {
namespace Test {

class MockObserver : public IStateMachineObserver {
public:
    MOCK_METHOD(void, onStateChanged, (const std::optional<StateId> &from, StateId to), (override));
    MOCK_METHOD(void, onTransitionTriggered, (StateId from, StateId to), (override));
    MOCK_METHOD(void, onStateTimeout, (StateId state), (override));
    MOCK_METHOD(void, onTimeoutBlocked, (StateId state), (override));
};

}  // namespace Test
}  // namespace FSE

#pragma once

#include "animation/IAnimator.h"
#include <gmock/gmock.h>

namespace FSE {
namespace Test {

class MockAnimator : public IAnimator {
public:
    MOCK_METHOD(void, playAnimation,
                (const std::string &name, float speed, float blend, bool loop, std::function<void()> onFinished),
                (override));
};

}  // namespace Test
}  // namespace FSE

#pragma once

#include "events/PulseCondition.h"
#include <cstddef>
#include <functional>
#include <map>

namespace FSE {
namespace Test {

/**
 * @brief Minimal synchronous event source standing in for a host signal
 */
class TestSignal {
public:
    using Slot = std::function<void()>;

    std::size_t connect(Slot slot) {
        slots_[nextId_] = std::move(slot);
        return nextId_++;
    }

    void disconnect(std::size_t id) {
        slots_.erase(id);
    }

    void emit() {
        auto slots = slots_;
        for (auto &[id, slot] : slots) {
            slot();
        }
    }

    std::size_t connectionCount() const {
        return slots_.size();
    }

    PulseCondition::Subscribe subscriber() {
        return [this](PulseCondition::Trigger trigger) -> PulseCondition::Unsubscribe {
            std::size_t id = connect(std::move(trigger));
            return [this, id]() { disconnect(id); };
        };
    }

private:
    std::map<std::size_t, Slot> slots_;
    std::size_t nextId_ = 0;
};

}  // namespace Test
}  // namespace FSE

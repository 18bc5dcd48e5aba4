// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/Constants.h"
#include "model/StateId.h"
#include <cstdint>
#include <functional>
#include <optional>

namespace FSE {

/**
 * @brief Directed, conditioned edge between two states
 *
 * A transition without a source (`getFrom()` empty) is global: it is
 * evaluated whatever state is active, after that state's local transitions.
 *
 * Candidates are ordered by priority (higher first), ties broken by
 * insertion order (first added wins). The insertion index is assigned by the
 * owning StateMachine and never changes.
 */
class Transition {
public:
    using Condition = std::function<bool()>;
    using Callback = std::function<void()>;

    Transition(std::optional<StateId> from, StateId to, Condition condition, float minDwellOverride,
               std::uint64_t insertionIndex);

    const std::optional<StateId> &getFrom() const {
        return from_;
    }

    StateId getTo() const {
        return to_;
    }

    bool isGlobal() const {
        return !from_.has_value();
    }

    int getPriority() const {
        return priority_;
    }

    float getMinDwellOverride() const {
        return minDwellOverride_;
    }

    bool isForceInstant() const {
        return forceInstant_;
    }

    std::uint64_t getInsertionIndex() const {
        return insertionIndex_;
    }

    /**
     * @brief Set priority; negative values are clamped to 0
     */
    Transition &setPriority(int priority);
    Transition &setHighestPriority();

    /**
     * @brief Bypass the minimum dwell check entirely
     */
    Transition &forceInstant(bool enabled = true);

    /**
     * @brief Replace the source state's minimum dwell for this edge (values <= 0 disable the override)
     */
    Transition &setMinDwellOverride(float seconds);

    Transition &setCondition(Condition condition);

    /**
     * @brief Callback invoked after this transition fired
     */
    Transition &setOnTriggered(Callback callback);

    /**
     * @brief Minimum dwell this edge requires given the source state's floor
     */
    float effectiveMinDwell(float stateMinDwell) const {
        return minDwellOverride_ > 0.0f ? minDwellOverride_ : stateMinDwell;
    }

    /**
     * @brief Whether the dwell requirement is met at the given elapsed time
     */
    bool isTimeRequirementMet(float dwellTime, float stateMinDwell) const {
        return forceInstant_ || dwellTime >= effectiveMinDwell(stateMinDwell);
    }

    /**
     * @brief Evaluate the condition (absent condition is always true)
     */
    bool evaluate() const;

    void notifyTriggered() const;

    /**
     * @brief Strict weak ordering: priority descending, insertion index ascending
     */
    static bool precedes(const Transition &a, const Transition &b) {
        if (a.priority_ != b.priority_) {
            return a.priority_ > b.priority_;
        }
        return a.insertionIndex_ < b.insertionIndex_;
    }

private:
    std::optional<StateId> from_;
    StateId to_;
    Condition condition_;
    float minDwellOverride_;
    int priority_ = Constants::DEFAULT_PRIORITY;
    bool forceInstant_ = false;
    std::uint64_t insertionIndex_;
    Callback onTriggered_;
};

}  // namespace FSE

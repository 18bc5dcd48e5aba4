// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "model/Transition.h"
#include <algorithm>

namespace FSE {

Transition::Transition(std::optional<StateId> from, StateId to, Condition condition, float minDwellOverride,
                       std::uint64_t insertionIndex)
    : from_(from), to_(to), condition_(std::move(condition)), minDwellOverride_(minDwellOverride),
      insertionIndex_(insertionIndex) {}

Transition &Transition::setPriority(int priority) {
    priority_ = std::max(0, priority);
    return *this;
}

Transition &Transition::setHighestPriority() {
    priority_ = Constants::HIGHEST_PRIORITY;
    return *this;
}

Transition &Transition::forceInstant(bool enabled) {
    forceInstant_ = enabled;
    return *this;
}

Transition &Transition::setMinDwellOverride(float seconds) {
    minDwellOverride_ = seconds;
    return *this;
}

Transition &Transition::setCondition(Condition condition) {
    condition_ = std::move(condition);
    return *this;
}

Transition &Transition::setOnTriggered(Callback callback) {
    onTriggered_ = std::move(callback);
    return *this;
}

bool Transition::evaluate() const {
    return condition_ ? condition_() : true;
}

void Transition::notifyTriggered() const {
    if (onTriggered_) {
        onTriggered_();
    }
}

}  // namespace FSE

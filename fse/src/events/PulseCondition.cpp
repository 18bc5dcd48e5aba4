// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "events/PulseCondition.h"
#include "common/Logger.h"

namespace FSE {

std::shared_ptr<PulseCondition> PulseCondition::create(Subscribe subscribe) {
    auto pulse = std::make_shared<PulseCondition>(PrivateTag{});

    if (subscribe) {
        // The source may outlive the pulse; fire through a weak reference
        std::weak_ptr<PulseCondition> weak = pulse;
        pulse->unsubscribe_ = subscribe([weak]() {
            if (auto self = weak.lock()) {
                self->fire();
            }
        });
    }

    return pulse;
}

PulseCondition::~PulseCondition() {
    unsubscribe();
}

bool PulseCondition::consume() {
    bool fired = pending_;
    pending_ = false;
    return fired;
}

void PulseCondition::unsubscribe() {
    if (unsubscribe_) {
        auto release = std::move(unsubscribe_);
        unsubscribe_ = nullptr;
        release();
    }
}

void PulseCondition::detach() {
    if (unsubscribe_) {
        LOG_DEBUG("PulseCondition: event source gone, dropping subscription");
    }
    unsubscribe_ = nullptr;
}

std::function<bool()> PulseCondition::asCondition() {
    auto self = shared_from_this();
    return [self]() { return self->consume(); };
}

}  // namespace FSE

// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "animation/IAnimator.h"
#include "common/Constants.h"
#include "runtime/IStateMachineObserver.h"
#include "runtime/StateMachine.h"
#include <memory>
#include <vector>

namespace FSE {

/**
 * @brief Builder assembling a StateMachine with its collaborators
 *
 * @code
 * auto machine = FSE::StateMachineBuilder()
 *                    .withAnimator(spriteAnimator)
 *                    .withObserver(&soundCues)
 *                    .withIdFormatter([](FSE::StateId id) { return toString(id.as<Move>()); })
 *                    .build();
 * @endcode
 */
class StateMachineBuilder {
private:
    std::shared_ptr<IAnimator> animator_;
    std::vector<IStateMachineObserver *> observers_;
    StateMachine::IdFormatter idFormatter_;
    std::size_t evaluatorPoolSize_ = Constants::DEFAULT_EVALUATOR_POOL_SIZE;

public:
    StateMachineBuilder() = default;

    /**
     * @brief Set the animation capability used on state entry
     * @return Reference to builder for method chaining
     */
    StateMachineBuilder &withAnimator(std::shared_ptr<IAnimator> animator) {
        animator_ = std::move(animator);
        return *this;
    }

    /**
     * @brief Register an observer (not owned)
     * @return Reference to builder for method chaining
     */
    StateMachineBuilder &withObserver(IStateMachineObserver *observer) {
        observers_.push_back(observer);
        return *this;
    }

    /**
     * @brief Set the state name formatter used by logs and debug dumps
     * @return Reference to builder for method chaining
     */
    StateMachineBuilder &withIdFormatter(StateMachine::IdFormatter formatter) {
        idFormatter_ = std::move(formatter);
        return *this;
    }

    /**
     * @brief Set how many evaluator buffers are created up front
     * @return Reference to builder for method chaining
     */
    StateMachineBuilder &withEvaluatorPoolSize(std::size_t size) {
        evaluatorPoolSize_ = size;
        return *this;
    }

    /**
     * @brief Build the configured machine
     *
     * The machine is returned empty; the first addState() activates it.
     */
    std::unique_ptr<StateMachine> build() const {
        auto machine = std::make_unique<StateMachine>(evaluatorPoolSize_);

        if (animator_) {
            machine->setAnimator(animator_);
        }
        if (idFormatter_) {
            machine->setIdFormatter(idFormatter_);
        }
        for (auto *observer : observers_) {
            machine->addObserver(observer);
        }

        return machine;
    }
};

}  // namespace FSE

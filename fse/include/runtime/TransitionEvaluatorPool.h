// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/Constants.h"
#include "model/Transition.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace FSE {

/**
 * @brief Scratch buffer holding the candidate transitions of one tick
 *
 * Candidates are held by shared_ptr so a hook that removes a transition
 * while the tick is being resolved cannot invalidate the buffer.
 */
class TransitionEvaluator {
public:
    using TransitionPtr = std::shared_ptr<Transition>;

    TransitionEvaluator() {
        candidates_.reserve(Constants::EVALUATOR_RESERVED_CANDIDATES);
    }

    /**
     * @brief Append a pre-ordered list, preserving its order after existing candidates
     */
    void append(const std::vector<TransitionPtr> &transitions) {
        candidates_.insert(candidates_.end(), transitions.begin(), transitions.end());
    }

    const std::vector<TransitionPtr> &getCandidates() const {
        return candidates_;
    }

    bool hasCandidates() const {
        return !candidates_.empty();
    }

    /**
     * @brief Drop all candidates, keeping the allocated capacity
     */
    void reset() {
        candidates_.clear();
    }

private:
    std::vector<TransitionPtr> candidates_;
};

/**
 * @brief Recycles TransitionEvaluator buffers across ticks
 *
 * Borrowing is RAII-scoped: acquire() returns a Lease that hands the buffer
 * back (cleared) when it goes out of scope, including during stack unwinding
 * from a throwing hook. A Lease must not outlive the pool that issued it.
 *
 * @code
 * auto lease = pool.acquire();
 * lease->append(localTransitions);
 * lease->append(globalTransitions);
 * for (const auto &candidate : lease->getCandidates()) { ... }
 * @endcode
 */
class TransitionEvaluatorPool {
public:
    class Lease {
    public:
        Lease(Lease &&other) noexcept;
        Lease &operator=(Lease &&other) noexcept;
        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;
        ~Lease();

        TransitionEvaluator *operator->() const {
            return evaluator_.get();
        }

        TransitionEvaluator &operator*() const {
            return *evaluator_;
        }

    private:
        friend class TransitionEvaluatorPool;

        Lease(TransitionEvaluatorPool *pool, std::unique_ptr<TransitionEvaluator> evaluator);
        void giveBack();

        TransitionEvaluatorPool *pool_;
        std::unique_ptr<TransitionEvaluator> evaluator_;
    };

    /**
     * @param warmupSize Evaluators created up front
     */
    explicit TransitionEvaluatorPool(std::size_t warmupSize = Constants::DEFAULT_EVALUATOR_POOL_SIZE);

    TransitionEvaluatorPool(const TransitionEvaluatorPool &) = delete;
    TransitionEvaluatorPool &operator=(const TransitionEvaluatorPool &) = delete;

    /**
     * @brief Borrow an evaluator, creating one if the pool is empty
     */
    Lease acquire();

    /**
     * @brief Evaluators currently idle in the pool
     */
    std::size_t available() const {
        return free_.size();
    }

    /**
     * @brief Evaluators ever created by this pool
     */
    std::size_t totalCreated() const {
        return created_;
    }

    /**
     * @brief Evaluators currently borrowed
     */
    std::size_t outstanding() const {
        return created_ - free_.size();
    }

private:
    void release(std::unique_ptr<TransitionEvaluator> evaluator);

    std::vector<std::unique_ptr<TransitionEvaluator>> free_;
    std::size_t created_ = 0;
};

}  // namespace FSE

// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/TransitionEvaluatorPool.h"
#include "common/Logger.h"

namespace FSE {

TransitionEvaluatorPool::Lease::Lease(TransitionEvaluatorPool *pool, std::unique_ptr<TransitionEvaluator> evaluator)
    : pool_(pool), evaluator_(std::move(evaluator)) {}

TransitionEvaluatorPool::Lease::Lease(Lease &&other) noexcept
    : pool_(other.pool_), evaluator_(std::move(other.evaluator_)) {
    other.pool_ = nullptr;
}

TransitionEvaluatorPool::Lease &TransitionEvaluatorPool::Lease::operator=(Lease &&other) noexcept {
    if (this != &other) {
        giveBack();
        pool_ = other.pool_;
        evaluator_ = std::move(other.evaluator_);
        other.pool_ = nullptr;
    }
    return *this;
}

TransitionEvaluatorPool::Lease::~Lease() {
    giveBack();
}

void TransitionEvaluatorPool::Lease::giveBack() {
    if (pool_ && evaluator_) {
        pool_->release(std::move(evaluator_));
    }
    pool_ = nullptr;
}

TransitionEvaluatorPool::TransitionEvaluatorPool(std::size_t warmupSize) {
    free_.reserve(warmupSize);
    for (std::size_t i = 0; i < warmupSize; ++i) {
        free_.push_back(std::make_unique<TransitionEvaluator>());
    }
    created_ = warmupSize;
}

TransitionEvaluatorPool::Lease TransitionEvaluatorPool::acquire() {
    if (free_.empty()) {
        ++created_;
        LOG_TRACE("TransitionEvaluatorPool: pool empty, creating evaluator #{}", created_);
        return Lease(this, std::make_unique<TransitionEvaluator>());
    }

    auto evaluator = std::move(free_.back());
    free_.pop_back();
    return Lease(this, std::move(evaluator));
}

void TransitionEvaluatorPool::release(std::unique_ptr<TransitionEvaluator> evaluator) {
    evaluator->reset();
    free_.push_back(std::move(evaluator));
}

}  // namespace FSE

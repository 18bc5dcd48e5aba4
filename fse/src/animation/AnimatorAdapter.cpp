// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "animation/AnimatorAdapter.h"
#include "common/Logger.h"

namespace FSE {

void AnimatorAdapter::playAnimation(const std::string &name, float speed, float blend, bool loop,
                                    std::function<void()> onFinished) {
    if (name.empty()) {
        return;
    }

    if (!hasAnimation(name)) {
        LOG_WARN("AnimatorAdapter: animation '{}' not found in backend", name);
        return;
    }

    if (onFinished) {
        finishCallbacks_[name] = std::move(onFinished);
    }

    startPlayback(AnimationRequest{name, speed, blend, loop});
}

bool AnimatorAdapter::notifyFinished(const std::string &name) {
    auto it = finishCallbacks_.find(name);
    if (it == finishCallbacks_.end()) {
        return false;
    }

    // Erase first: the callback may start the same animation again
    auto callback = std::move(it->second);
    finishCallbacks_.erase(it);
    if (callback) {
        callback();
    }
    return true;
}

CallbackAnimator::CallbackAnimator(PlayFunction play, LookupFunction lookup)
    : play_(std::move(play)), lookup_(std::move(lookup)) {}

bool CallbackAnimator::hasAnimation(const std::string &name) const {
    return lookup_ ? lookup_(name) : true;
}

void CallbackAnimator::startPlayback(const AnimationRequest &request) {
    if (play_) {
        play_(request);
    }
}

}  // namespace FSE

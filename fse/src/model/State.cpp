// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "model/State.h"
#include "common/Logger.h"
#include <algorithm>

namespace FSE {

State::State(StateId id, UpdateHook update, Hook onEnter, Hook onExit, float minDwellTime, float timeout,
             TickKind tickKind)
    : id_(id), restartId_(id), minDwellTime_(std::max(0.0f, minDwellTime)), timeout_(timeout), tickKind_(tickKind),
      update_(std::move(update)), onEnter_(std::move(onEnter)), onExit_(std::move(onExit)) {}

State &State::setRestartId(StateId id) {
    restartId_ = id;
    return *this;
}

State &State::setMinDwellTime(float seconds) {
    if (seconds < 0.0f) {
        LOG_WARN("State {}: negative minimum dwell time {} clamped to 0", id_.value(), seconds);
    }
    minDwellTime_ = std::max(0.0f, seconds);
    return *this;
}

State &State::setTimeout(float seconds) {
    timeout_ = seconds;
    return *this;
}

State &State::setTickKind(TickKind kind) {
    tickKind_ = kind;
    return *this;
}

State &State::setUpdate(UpdateHook update) {
    update_ = std::move(update);
    return *this;
}

State &State::setOnEnter(Hook onEnter) {
    onEnter_ = std::move(onEnter);
    return *this;
}

State &State::setOnExit(Hook onExit) {
    onExit_ = std::move(onExit);
    return *this;
}

void State::invokeUpdate(double delta) const {
    if (update_) {
        update_(delta);
    }
}

void State::invokeEnter() const {
    if (onEnter_) {
        onEnter_();
    }
}

void State::invokeExit() const {
    if (onExit_) {
        onExit_();
    }
}

State &State::lock(LockMode mode) {
    lockMode_ = mode;
    return *this;
}

State &State::unlock() {
    lockMode_ = LockMode::None;
    return *this;
}

State &State::addTag(const std::string &tag) {
    if (!tag.empty()) {
        tags_.insert(tag);
    }
    return *this;
}

State &State::addTags(std::initializer_list<std::string> tags) {
    for (const auto &tag : tags) {
        addTag(tag);
    }
    return *this;
}

State &State::removeTag(const std::string &tag) {
    tags_.erase(tag);
    return *this;
}

bool State::hasTag(const std::string &tag) const {
    return tags_.count(tag) > 0;
}

State &State::removeData(const std::string &key) {
    data_.remove(key);
    return *this;
}

State &State::setAnimation(AnimationConfig config) {
    data_.set<AnimationConfig>(Constants::ANIMATION_DATA_KEY, std::move(config));
    return *this;
}

State &State::setAnimationData(const std::string &animationName, float speed, float blendTime, bool loop,
                               std::function<void()> onFinished) {
    return setAnimation(AnimationConfig{animationName, speed, blendTime, loop, std::move(onFinished)});
}

const AnimationConfig *State::getAnimation() const {
    return data_.find<AnimationConfig>(Constants::ANIMATION_DATA_KEY);
}

}  // namespace FSE

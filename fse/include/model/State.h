// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "animation/AnimationConfig.h"
#include "common/Constants.h"
#include "model/DataStore.h"
#include "model/StateId.h"
#include <functional>
#include <initializer_list>
#include <set>
#include <string>

namespace FSE {

/**
 * @brief Frame phase a state advances on
 *
 * Physics states only tick on the fixed-step phase, Render states only on
 * the variable-step phase.
 */
enum class TickKind { Physics, Render };

/**
 * @brief Per-state transition lock
 *
 * - None: conditioned transitions and timeout both active
 * - TransitionOnly: conditioned transitions suppressed, timeout still fires
 * - Full: conditioned transitions and timeout suppressed
 *
 * Any lock mode also blocks manual navigation (force, go back) and skips the
 * exit hook when the state is left.
 */
enum class LockMode { None, TransitionOnly, Full };

/**
 * @brief Named unit of behavior inside a StateMachine
 *
 * Created by StateMachine::addState and shared by reference with the caller,
 * who configures it afterwards through the fluent setters:
 *
 * @code
 * machine.addState(Move::Attack, onAttackUpdate)
 *     ->setTimeout(0.4f)
 *     .lock(LockMode::TransitionOnly)
 *     .addTags({"combat"})
 *     .setAnimationData("attack_1", 1.2f);
 * @endcode
 */
class State {
public:
    using UpdateHook = std::function<void(double)>;
    using Hook = std::function<void()>;

    State(StateId id, UpdateHook update, Hook onEnter, Hook onExit, float minDwellTime, float timeout,
          TickKind tickKind = TickKind::Physics);

    StateId getId() const {
        return id_;
    }

    StateId getRestartId() const {
        return restartId_;
    }

    float getMinDwellTime() const {
        return minDwellTime_;
    }

    float getTimeout() const {
        return timeout_;
    }

    bool hasTimeout() const {
        return timeout_ > 0.0f;
    }

    TickKind getTickKind() const {
        return tickKind_;
    }

    LockMode getLockMode() const {
        return lockMode_;
    }

    State &setRestartId(StateId id);
    State &setMinDwellTime(float seconds);
    State &setTimeout(float seconds);
    State &setTickKind(TickKind kind);

    State &setUpdate(UpdateHook update);
    State &setOnEnter(Hook onEnter);
    State &setOnExit(Hook onExit);

    // Absent hooks are no-ops
    void invokeUpdate(double delta) const;
    void invokeEnter() const;
    void invokeExit() const;

    /**
     * @brief Lock the state
     * @param mode Lock mode (TransitionOnly unless stated)
     */
    State &lock(LockMode mode = LockMode::TransitionOnly);
    State &unlock();

    bool isLocked() const {
        return lockMode_ != LockMode::None;
    }

    bool isFullyLocked() const {
        return lockMode_ == LockMode::Full;
    }

    bool isTransitionBlocked() const {
        return lockMode_ == LockMode::TransitionOnly;
    }

    State &addTag(const std::string &tag);
    State &addTags(std::initializer_list<std::string> tags);
    State &removeTag(const std::string &tag);
    bool hasTag(const std::string &tag) const;

    const std::set<std::string> &getTags() const {
        return tags_;
    }

    template <typename T> State &setData(const std::string &key, T value) {
        data_.set<T>(key, std::move(value));
        return *this;
    }

    template <typename T> State &setData(const DataKey<T> &key, T value) {
        data_.set<T>(key, std::move(value));
        return *this;
    }

    template <typename T> const T *findData(const std::string &key) const {
        return data_.find<T>(key);
    }

    template <typename T> const T *findData(const DataKey<T> &key) const {
        return data_.find<T>(key);
    }

    template <typename T> T getData(const std::string &key, T defaultValue = T{}) const {
        return data_.get<T>(key, std::move(defaultValue));
    }

    template <typename T> T getData(const DataKey<T> &key, T defaultValue = T{}) const {
        return data_.get<T>(key, std::move(defaultValue));
    }

    bool hasData(const std::string &key) const {
        return data_.contains(key);
    }

    State &removeData(const std::string &key);

    const DataStore &getDataStore() const {
        return data_;
    }

    /**
     * @brief Attach an animation descriptor played on every entry
     */
    State &setAnimation(AnimationConfig config);
    State &setAnimationData(const std::string &animationName, float speed = 1.0f, float blendTime = -1.0f,
                            bool loop = false, std::function<void()> onFinished = nullptr);

    /**
     * @brief Animation descriptor, nullptr if none is attached
     */
    const AnimationConfig *getAnimation() const;

private:
    StateId id_;
    StateId restartId_;
    float minDwellTime_;
    float timeout_;
    TickKind tickKind_;
    LockMode lockMode_ = LockMode::None;

    UpdateHook update_;
    Hook onEnter_;
    Hook onExit_;

    std::set<std::string> tags_;
    DataStore data_;
};

}  // namespace FSE

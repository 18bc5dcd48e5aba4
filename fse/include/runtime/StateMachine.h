// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "animation/IAnimator.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "events/PulseCondition.h"
#include "model/DataStore.h"
#include "model/State.h"
#include "model/StateId.h"
#include "model/Transition.h"
#include "runtime/IStateMachineObserver.h"
#include "runtime/TransitionEvaluatorPool.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace FSE {

/**
 * @brief Frame-driven finite state machine
 *
 * Owns the state registry, the per-source and global transition lists and
 * the active state. The host drives it by calling update() once per frame
 * phase it runs (fixed-step physics and/or variable-step render).
 *
 * Per tick, for the active state (only if its TickKind matches):
 * 1. dwell time advances and the update hook runs
 * 2. an elapsed timeout restarts into the state's restart id (unless Full-locked)
 * 3. unless locked, local transitions then global transitions are tried in
 *    priority order; the first whose dwell requirement and condition hold fires
 *
 * At most one transition fires per update() call.
 *
 * Not thread-safe: build, mutate and tick from a single thread. Hooks may
 * add or remove states and transitions or change state, but must not call
 * update() again.
 *
 * @code
 * enum class Move { Idle, Run, Jump };
 *
 * FSE::StateMachine machine;
 * machine.addState(Move::Idle);
 * machine.addState(Move::Run, nullptr, nullptr, nullptr, 0.2f);
 * machine.addState(Move::Jump)->setTimeout(0.5f);
 *
 * machine.addTransition(Move::Idle, Move::Run, [&] { return input.move; })->setPriority(1);
 * machine.addGlobalTransition(Move::Jump, [&] { return input.jump; })->setPriority(10);
 *
 * // every physics frame
 * machine.update(FSE::TickKind::Physics, dt);
 * @endcode
 */
class StateMachine {
public:
    using StatePtr = std::shared_ptr<State>;
    using TransitionPtr = std::shared_ptr<Transition>;
    using TransitionList = std::vector<TransitionPtr>;
    using IdFormatter = std::function<std::string(StateId)>;

    explicit StateMachine(std::size_t evaluatorPoolSize = Constants::DEFAULT_EVALUATOR_POOL_SIZE);
    ~StateMachine();

    StateMachine(const StateMachine &) = delete;
    StateMachine &operator=(const StateMachine &) = delete;

    // ------------------------------------------------------------------
    // State registry
    // ------------------------------------------------------------------

    /**
     * @brief Register a state
     *
     * The first state ever added becomes both the initial and the active
     * state (its enter hook runs, no change notification is emitted). Later
     * states get the current initial id as their restart id.
     *
     * @param id Unique state id
     * @param update Per-tick hook, receives the frame delta
     * @param onEnter Entry hook
     * @param onExit Exit hook
     * @param minDwellTime Seconds before any conditioned transition may leave this state
     * @param timeout Seconds after which the state restarts into its restart id (<= 0 disables)
     * @param tickKind Frame phase the state advances on
     * @return The new state, or nullptr if the id already exists
     */
    StatePtr addState(StateId id, State::UpdateHook update = nullptr, State::Hook onEnter = nullptr,
                      State::Hook onExit = nullptr, float minDwellTime = 0.0f, float timeout = Constants::NO_TIMEOUT,
                      TickKind tickKind = TickKind::Physics);

    /**
     * @brief Remove a state and every transition referencing it
     *
     * Removing the initial state makes the first remaining registered state
     * the initial one, and restart ids naming the removed state are re-pointed
     * to it. Removing the active state then resets the machine to the initial
     * state.
     *
     * @return false if the state does not exist
     */
    bool removeState(StateId id);

    /**
     * @brief Look up a state for configuration
     * @return Shared state object, nullptr if not found
     */
    StatePtr getState(StateId id) const;

    bool hasStateId(StateId id) const;

    std::size_t stateCount() const {
        return states_.size();
    }

    /**
     * @brief Designate the state reset() returns to
     * @return false if the state does not exist
     */
    bool setInitialId(StateId id);

    std::optional<StateId> getInitialStateId() const {
        return initialId_;
    }

    /**
     * @brief Return to the initial state and forget the previous state
     *
     * Without a designated initial state the first registered state is used.
     *
     * @return false if the machine is empty
     */
    bool reset();

    /**
     * @brief Re-run exit/enter of the active state and zero its dwell time
     *
     * The exit hook is skipped while the state is locked.
     *
     * @return false if no state is active
     */
    bool restartCurrentState(bool ignoreExit = false, bool ignoreEnter = false);

    // ------------------------------------------------------------------
    // Manual navigation (blocked while the active state is locked)
    // ------------------------------------------------------------------

    /**
     * @brief Change state when a caller-side condition holds
     * @return true if the state changed
     */
    bool tryChangeState(StateId id, bool condition = true);

    /**
     * @brief Change state unconditionally
     * @return false if the target is unknown or the active state is locked
     */
    bool forceChangeState(StateId id);

    /**
     * @brief Return to the previous state, reporting an error when impossible
     */
    bool goBack();

    /**
     * @brief Return to the previous state if there is one and nothing is locked
     */
    bool goBackIfPossible();

    // ------------------------------------------------------------------
    // Transition registry
    // ------------------------------------------------------------------

    /**
     * @brief Add a local transition
     *
     * @param from Source state (need not exist yet)
     * @param to Target state (must exist)
     * @param condition Side-effect-free predicate (empty means always true)
     * @param minDwellOverride Replaces the source state's minimum dwell when > 0
     * @return The transition for further configuration, nullptr if `to` is unknown
     */
    TransitionPtr addTransition(StateId from, StateId to, Transition::Condition condition,
                                float minDwellOverride = Constants::NO_DWELL_OVERRIDE);

    /**
     * @brief Add the same transition from several sources
     *
     * `minDwellOverrides[i]` applies to `from[i]`; missing entries mean no override.
     *
     * @return Created transitions (failed ones are skipped)
     */
    TransitionList addTransitions(const std::vector<StateId> &from, StateId to, Transition::Condition condition,
                                  const std::vector<float> &minDwellOverrides = {});

    /**
     * @brief Add a transition evaluated from every state, after local ones
     */
    TransitionPtr addGlobalTransition(StateId to, Transition::Condition condition,
                                      float minDwellOverride = Constants::NO_DWELL_OVERRIDE);

    /**
     * @brief Add a local transition fired by an external event
     *
     * The subscription lives as long as the transition. Events fired while
     * `from` is inactive are discarded when it is entered.
     */
    TransitionPtr addEventTransition(StateId from, StateId to, PulseCondition::Subscribe subscribe,
                                     float minDwellOverride = Constants::NO_DWELL_OVERRIDE);

    TransitionPtr addGlobalEventTransition(StateId to, PulseCondition::Subscribe subscribe,
                                           float minDwellOverride = Constants::NO_DWELL_OVERRIDE);

    /**
     * @brief Remove the first local transition from -> to
     * @return false (with an error report) if none matched
     */
    bool removeTransition(StateId from, StateId to);

    /**
     * @brief Remove the first global transition targeting `to`
     * @return false (with an error report) if none matched
     */
    bool removeGlobalTransition(StateId to);

    void clearTransitionsFrom(StateId from);
    void clearTransitions();
    void clearGlobalTransitions();

    bool hasTransition(StateId from, StateId to) const;
    bool hasAnyTransitionFrom(StateId id) const;
    bool hasAnyGlobalTransition(StateId to) const;

    // ------------------------------------------------------------------
    // Processing
    // ------------------------------------------------------------------

    /**
     * @brief Advance the machine by one frame phase
     *
     * Inert while paused, empty, or when the active state runs on another
     * TickKind.
     *
     * @param tickKind Frame phase being processed
     * @param delta Seconds since the previous tick of this phase
     */
    void update(TickKind tickKind, double delta);

    void pause() {
        paused_ = true;
    }

    /**
     * @brief Resume ticking
     * @param resetStateTime Zero the dwell clock so the state behaves as freshly entered
     */
    void resume(bool resetStateTime = false);

    bool isPaused() const {
        return paused_;
    }

    void resetStateTime() {
        stateTime_ = 0.0f;
    }

    // ------------------------------------------------------------------
    // Collaborators
    // ------------------------------------------------------------------

    /**
     * @brief Attach the animation capability used for states carrying an AnimationConfig
     */
    void setAnimator(std::shared_ptr<IAnimator> animator);

    std::shared_ptr<IAnimator> getAnimator() const {
        return animator_;
    }

    /**
     * @brief Register an observer (not owned, must outlive its registration)
     */
    void addObserver(IStateMachineObserver *observer);
    void removeObserver(IStateMachineObserver *observer);

    /**
     * @brief Human-readable names for logs and debug dumps
     */
    void setIdFormatter(IdFormatter formatter);
    std::string formatId(StateId id) const;

    // ------------------------------------------------------------------
    // Machine-level data
    // ------------------------------------------------------------------

    template <typename T> bool setGlobalData(const std::string &key, T value) {
        if (!globalData_.set<T>(key, std::move(value))) {
            LOG_WARN("StateMachine: rejected global data with empty key");
            return false;
        }
        return true;
    }

    bool removeGlobalData(const std::string &key) {
        return globalData_.remove(key);
    }

    template <typename T> const T *findGlobalData(const std::string &key) const {
        return globalData_.find<T>(key);
    }

    template <typename T> T getGlobalData(const std::string &key, T defaultValue = T{}) const {
        return globalData_.get<T>(key, std::move(defaultValue));
    }

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    std::optional<StateId> getCurrentStateId() const {
        return currentId_;
    }

    StatePtr getCurrentState() const {
        return currentState_;
    }

    std::optional<StateId> getPreviousStateId() const {
        return previousId_;
    }

    bool hasPreviousState() const {
        return previousId_.has_value();
    }

    bool isCurrentState(StateId id) const {
        return currentId_ == id;
    }

    bool isPreviousState(StateId id) const {
        return previousId_ == id;
    }

    bool isInStateWithTag(const std::string &tag) const;

    /**
     * @brief Seconds spent in the active state
     */
    float getStateTime() const {
        return stateTime_;
    }

    float getMinStateTime() const;

    /**
     * @brief Seconds until the active state's timeout, -1 without timeout
     */
    float getRemainingTime() const;

    const TransitionEvaluatorPool &getEvaluatorPool() const {
        return evaluatorPool_;
    }

    // ------------------------------------------------------------------
    // Debugging
    // ------------------------------------------------------------------

    /**
     * @brief "previous -> current"
     */
    std::string debugCurrentTransition() const;

    /**
     * @brief One line per transition in evaluation order, globals last
     */
    std::string debugAllTransitions() const;

    /**
     * @brief State names in registration order, one per line
     */
    std::string debugAllStates() const;

private:
    enum class ExitPolicy { Run, Skip };

    bool changeStateInternal(StateId id, ExitPolicy exitPolicy = ExitPolicy::Run);
    bool canNavigate(const char *operation) const;

    TransitionPtr createTransition(std::optional<StateId> from, StateId to, Transition::Condition condition,
                                   float minDwellOverride);
    static void sortByPriority(TransitionList &transitions);

    void checkTransitions();
    bool checkTimeout();
    bool checkConditionedTransitions();

    void playAnimation(const State &state);
    void discardPendingPulses(StateId id);

    void notifyStateChanged(const std::optional<StateId> &from, StateId to);
    void notifyTransitionTriggered(StateId from, StateId to);
    void notifyStateTimeout(StateId id);
    void notifyTimeoutBlocked(StateId id);

    std::unordered_map<StateId, StatePtr> states_;
    std::vector<StateId> registrationOrder_;
    std::map<StateId, TransitionList> transitions_;
    TransitionList globalTransitions_;
    DataStore globalData_;

    StatePtr currentState_;
    std::optional<StateId> currentId_;
    std::optional<StateId> previousId_;
    std::optional<StateId> initialId_;

    bool paused_ = false;
    bool updating_ = false;
    float stateTime_ = 0.0f;
    std::uint64_t nextInsertionIndex_ = 0;

    TransitionEvaluatorPool evaluatorPool_;
    std::shared_ptr<IAnimator> animator_;
    std::vector<IStateMachineObserver *> observers_;
    std::map<StateId, std::vector<std::weak_ptr<PulseCondition>>> eventPulses_;
    IdFormatter idFormatter_;
};

}  // namespace FSE

// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/StateMachine.h"
#include "common/Logger.h"
#include "runtime/UpdateGuard.h"
#include <algorithm>
#include <sstream>

namespace FSE {

StateMachine::StateMachine(std::size_t evaluatorPoolSize) : evaluatorPool_(evaluatorPoolSize) {}

StateMachine::~StateMachine() = default;

// ============================================================================
// State registry
// ============================================================================

StateMachine::StatePtr StateMachine::addState(StateId id, State::UpdateHook update, State::Hook onEnter,
                                              State::Hook onExit, float minDwellTime, float timeout,
                                              TickKind tickKind) {
    if (states_.count(id) > 0) {
        LOG_ERROR("StateMachine: trying to store an existing state: {}", formatId(id));
        return nullptr;
    }

    auto state = std::make_shared<State>(id, std::move(update), std::move(onEnter), std::move(onExit), minDwellTime,
                                         timeout, tickKind);
    states_[id] = state;
    registrationOrder_.push_back(id);

    if (!currentState_ && !initialId_) {
        // First activation: nothing to exit, and no change notification before an initial exists
        changeStateInternal(id, ExitPolicy::Skip);
        initialId_ = id;
        LOG_DEBUG("StateMachine: {} is the initial state", formatId(id));
    } else if (initialId_) {
        state->setRestartId(*initialId_);
    }

    return state;
}

bool StateMachine::removeState(StateId id) {
    auto it = states_.find(id);
    if (it == states_.end()) {
        LOG_WARN("StateMachine: trying to remove a non-existent state: {}", formatId(id));
        return false;
    }

    StatePtr removed = it->second;
    states_.erase(it);
    registrationOrder_.erase(std::remove(registrationOrder_.begin(), registrationOrder_.end(), id),
                             registrationOrder_.end());

    // Prune every edge touching the removed state
    transitions_.erase(id);
    eventPulses_.erase(id);
    for (auto listIt = transitions_.begin(); listIt != transitions_.end();) {
        auto &list = listIt->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const TransitionPtr &transition) { return transition->getTo() == id; }),
                   list.end());
        listIt = list.empty() ? transitions_.erase(listIt) : std::next(listIt);
    }
    globalTransitions_.erase(std::remove_if(globalTransitions_.begin(), globalTransitions_.end(),
                                            [id](const TransitionPtr &transition) { return transition->getTo() == id; }),
                             globalTransitions_.end());

    if (initialId_ == id) {
        initialId_.reset();
        if (!registrationOrder_.empty()) {
            initialId_ = registrationOrder_.front();
            LOG_WARN("StateMachine: initial state {} removed, falling back to {}", formatId(id),
                     formatId(*initialId_));
        }
    }
    if (previousId_ == id) {
        previousId_.reset();
    }

    // Timeouts must never restart into a state that no longer exists
    for (const auto &[stateId, state] : states_) {
        if (state->getRestartId() == id) {
            state->setRestartId(initialId_.value_or(stateId));
        }
    }

    LOG_DEBUG("StateMachine: removed state {} ({} states left)", formatId(id), states_.size());

    if (currentId_ == id && !reset()) {
        LOG_WARN("StateMachine: active state {} removed with no initial state to fall back to", formatId(id));
        if (!removed->isLocked()) {
            removed->invokeExit();
        }
        currentState_.reset();
        currentId_.reset();
        stateTime_ = 0.0f;
    }

    return true;
}

StateMachine::StatePtr StateMachine::getState(StateId id) const {
    auto it = states_.find(id);
    return it != states_.end() ? it->second : nullptr;
}

bool StateMachine::hasStateId(StateId id) const {
    return states_.count(id) > 0;
}

bool StateMachine::setInitialId(StateId id) {
    if (!hasStateId(id)) {
        LOG_ERROR("StateMachine: trying to set non-existent state as initial: {}", formatId(id));
        return false;
    }

    initialId_ = id;
    return true;
}

bool StateMachine::reset() {
    if (states_.empty()) {
        LOG_WARN("StateMachine: trying to reset an empty state machine");
        return false;
    }

    if (!initialId_) {
        initialId_ = registrationOrder_.front();
        LOG_DEBUG("StateMachine: no initial state set, using first registered state {}", formatId(*initialId_));
    }

    if (!changeStateInternal(*initialId_)) {
        return false;
    }

    previousId_.reset();
    return true;
}

bool StateMachine::restartCurrentState(bool ignoreExit, bool ignoreEnter) {
    if (!currentState_) {
        LOG_WARN("StateMachine: trying to restart a non-existent state");
        return false;
    }

    StatePtr state = currentState_;
    stateTime_ = 0.0f;

    if (!ignoreExit && !state->isLocked()) {
        state->invokeExit();
    }
    if (!ignoreEnter) {
        state->invokeEnter();
    }
    return true;
}

// ============================================================================
// Manual navigation
// ============================================================================

bool StateMachine::tryChangeState(StateId id, bool condition) {
    if (!condition) {
        return false;
    }
    return forceChangeState(id);
}

bool StateMachine::forceChangeState(StateId id) {
    if (!hasStateId(id)) {
        LOG_ERROR("StateMachine: cannot change to unknown state {}", formatId(id));
        return false;
    }

    if (!canNavigate("forceChangeState")) {
        return false;
    }

    return changeStateInternal(id);
}

bool StateMachine::goBack() {
    if (goBackIfPossible()) {
        return true;
    }

    LOG_ERROR("StateMachine: there is no previous state to go back to or current state is locked. Current state: {}",
              currentId_ ? formatId(*currentId_) : std::string("None"));
    return false;
}

bool StateMachine::goBackIfPossible() {
    if (!previousId_ || !hasStateId(*previousId_)) {
        return false;
    }

    if (currentState_ && currentState_->isLocked()) {
        return false;
    }

    return changeStateInternal(*previousId_);
}

bool StateMachine::canNavigate(const char *operation) const {
    if (currentState_ && currentState_->isLocked()) {
        LOG_WARN("StateMachine: {} refused, state {} is locked", operation, formatId(currentState_->getId()));
        return false;
    }
    return true;
}

bool StateMachine::changeStateInternal(StateId id, ExitPolicy exitPolicy) {
    auto it = states_.find(id);
    if (it == states_.end()) {
        LOG_WARN("StateMachine: trying to switch to a non-existent state: {}", formatId(id));
        return false;
    }

    // Hold the target: hooks below may remove it from the registry
    StatePtr target = it->second;

    if (exitPolicy == ExitPolicy::Run && currentState_ && !currentState_->isLocked()) {
        currentState_->invokeExit();
    }

    std::optional<StateId> from = currentId_;
    stateTime_ = 0.0f;
    previousId_ = currentId_;
    currentId_ = id;
    currentState_ = target;

    LOG_DEBUG("StateMachine: {} -> {}", from ? formatId(*from) : std::string("None"), formatId(id));

    discardPendingPulses(id);
    target->invokeEnter();
    playAnimation(*target);

    if (initialId_) {
        notifyStateChanged(from, id);
    }
    return true;
}

// ============================================================================
// Transition registry
// ============================================================================

StateMachine::TransitionPtr StateMachine::createTransition(std::optional<StateId> from, StateId to,
                                                           Transition::Condition condition, float minDwellOverride) {
    return std::make_shared<Transition>(from, to, std::move(condition), minDwellOverride, nextInsertionIndex_++);
}

void StateMachine::sortByPriority(TransitionList &transitions) {
    auto precedes = [](const TransitionPtr &a, const TransitionPtr &b) { return Transition::precedes(*a, *b); };

    // Priorities can change after insertion through the returned handle
    if (!std::is_sorted(transitions.begin(), transitions.end(), precedes)) {
        std::sort(transitions.begin(), transitions.end(), precedes);
    }
}

StateMachine::TransitionPtr StateMachine::addTransition(StateId from, StateId to, Transition::Condition condition,
                                                        float minDwellOverride) {
    if (!hasStateId(to)) {
        LOG_ERROR("StateMachine: trying to add a transition {} -> {} to a non-existent state", formatId(from),
                  formatId(to));
        return nullptr;
    }

    auto transition = createTransition(from, to, std::move(condition), minDwellOverride);
    auto &list = transitions_[from];
    list.push_back(transition);
    sortByPriority(list);

    LOG_DEBUG("StateMachine: added transition {} -> {}", formatId(from), formatId(to));
    return transition;
}

StateMachine::TransitionList StateMachine::addTransitions(const std::vector<StateId> &from, StateId to,
                                                          Transition::Condition condition,
                                                          const std::vector<float> &minDwellOverrides) {
    TransitionList created;
    for (size_t i = 0; i < from.size(); ++i) {
        float minDwell = i < minDwellOverrides.size() ? minDwellOverrides[i] : Constants::NO_DWELL_OVERRIDE;
        if (auto transition = addTransition(from[i], to, condition, minDwell)) {
            created.push_back(std::move(transition));
        }
    }
    return created;
}

StateMachine::TransitionPtr StateMachine::addGlobalTransition(StateId to, Transition::Condition condition,
                                                              float minDwellOverride) {
    if (!hasStateId(to)) {
        LOG_ERROR("StateMachine: trying to add a global transition to a non-existent state: {}", formatId(to));
        return nullptr;
    }

    auto transition = createTransition(std::nullopt, to, std::move(condition), minDwellOverride);
    globalTransitions_.push_back(transition);
    sortByPriority(globalTransitions_);

    LOG_DEBUG("StateMachine: added global transition -> {}", formatId(to));
    return transition;
}

StateMachine::TransitionPtr StateMachine::addEventTransition(StateId from, StateId to,
                                                             PulseCondition::Subscribe subscribe,
                                                             float minDwellOverride) {
    auto pulse = PulseCondition::create(std::move(subscribe));
    auto transition = addTransition(from, to, pulse->asCondition(), minDwellOverride);
    if (transition) {
        eventPulses_[from].push_back(pulse);
    }
    return transition;
}

StateMachine::TransitionPtr StateMachine::addGlobalEventTransition(StateId to, PulseCondition::Subscribe subscribe,
                                                                   float minDwellOverride) {
    auto pulse = PulseCondition::create(std::move(subscribe));
    return addGlobalTransition(to, pulse->asCondition(), minDwellOverride);
}

bool StateMachine::removeTransition(StateId from, StateId to) {
    auto it = transitions_.find(from);
    if (it != transitions_.end()) {
        auto &list = it->second;
        auto match = std::find_if(list.begin(), list.end(),
                                  [to](const TransitionPtr &transition) { return transition->getTo() == to; });
        if (match != list.end()) {
            list.erase(match);
            if (list.empty()) {
                transitions_.erase(it);
            }
            return true;
        }
    }

    LOG_ERROR("StateMachine: no transition was found between {} -> {}", formatId(from), formatId(to));
    return false;
}

bool StateMachine::removeGlobalTransition(StateId to) {
    auto match = std::find_if(globalTransitions_.begin(), globalTransitions_.end(),
                              [to](const TransitionPtr &transition) { return transition->getTo() == to; });
    if (match == globalTransitions_.end()) {
        LOG_ERROR("StateMachine: no global transition was found to {}", formatId(to));
        return false;
    }

    globalTransitions_.erase(match);
    return true;
}

void StateMachine::clearTransitionsFrom(StateId from) {
    transitions_.erase(from);
}

void StateMachine::clearTransitions() {
    transitions_.clear();
}

void StateMachine::clearGlobalTransitions() {
    globalTransitions_.clear();
}

bool StateMachine::hasTransition(StateId from, StateId to) const {
    auto it = transitions_.find(from);
    if (it == transitions_.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(),
                       [to](const TransitionPtr &transition) { return transition->getTo() == to; });
}

bool StateMachine::hasAnyTransitionFrom(StateId id) const {
    auto it = transitions_.find(id);
    return it != transitions_.end() && !it->second.empty();
}

bool StateMachine::hasAnyGlobalTransition(StateId to) const {
    return std::any_of(globalTransitions_.begin(), globalTransitions_.end(),
                       [to](const TransitionPtr &transition) { return transition->getTo() == to; });
}

// ============================================================================
// Processing
// ============================================================================

void StateMachine::update(TickKind tickKind, double delta) {
    if (paused_ || !currentState_) {
        return;
    }

    if (updating_) {
        LOG_ERROR("StateMachine: re-entrant update() from a hook ignored");
        return;
    }

    if (currentState_->getTickKind() != tickKind) {
        return;
    }

    UpdateGuard guard(updating_);

    StatePtr state = currentState_;
    stateTime_ += static_cast<float>(delta);
    state->invokeUpdate(delta);

    // A hook that changed state already spent this tick's transition
    if (currentState_ != state) {
        return;
    }

    checkTransitions();
}

void StateMachine::checkTransitions() {
    if (checkTimeout()) {
        return;
    }

    if (currentState_->isLocked()) {
        return;
    }

    checkConditionedTransitions();
}

bool StateMachine::checkTimeout() {
    StatePtr state = currentState_;
    if (!state->hasTimeout() || stateTime_ < state->getTimeout()) {
        return false;
    }

    StateId id = state->getId();
    if (state->isFullyLocked()) {
        notifyTimeoutBlocked(id);
        return true;
    }

    notifyStateTimeout(id);

    StateId restartId = state->getRestartId();
    if (!changeStateInternal(restartId)) {
        LOG_ERROR("StateMachine: timeout of {} could not restart into {}", formatId(id), formatId(restartId));
        return false;
    }

    notifyTransitionTriggered(id, restartId);
    return true;
}

bool StateMachine::checkConditionedTransitions() {
    StatePtr state = currentState_;
    StateId from = state->getId();

    auto evaluator = evaluatorPool_.acquire();

    // Locals first, then globals: a local edge always wins over a global one
    auto it = transitions_.find(from);
    if (it != transitions_.end()) {
        sortByPriority(it->second);
        evaluator->append(it->second);
    }
    sortByPriority(globalTransitions_);
    evaluator->append(globalTransitions_);

    if (!evaluator->hasCandidates()) {
        return false;
    }

    for (const auto &transition : evaluator->getCandidates()) {
        if (!transition->isTimeRequirementMet(stateTime_, state->getMinDwellTime())) {
            continue;
        }
        if (!transition->evaluate()) {
            continue;
        }

        StateId to = transition->getTo();
        if (!changeStateInternal(to)) {
            continue;
        }

        notifyTransitionTriggered(from, to);
        transition->notifyTriggered();
        return true;
    }

    return false;
}

void StateMachine::resume(bool resetStateTime) {
    paused_ = false;
    if (resetStateTime) {
        stateTime_ = 0.0f;
    }
}

// ============================================================================
// Collaborators
// ============================================================================

void StateMachine::setAnimator(std::shared_ptr<IAnimator> animator) {
    animator_ = std::move(animator);
}

void StateMachine::playAnimation(const State &state) {
    const AnimationConfig *config = state.getAnimation();
    if (!config) {
        return;
    }

    auto animator = animator_;
    if (!animator) {
        LOG_DEBUG("StateMachine: no animator attached, skipping animation '{}' of {}", config->name,
                  formatId(state.getId()));
        return;
    }

    config->play(animator.get());
}

void StateMachine::discardPendingPulses(StateId id) {
    auto it = eventPulses_.find(id);
    if (it == eventPulses_.end()) {
        return;
    }

    // Pulses die with their transitions; drop the expired handles here
    auto &pulses = it->second;
    pulses.erase(std::remove_if(pulses.begin(), pulses.end(),
                                [](const std::weak_ptr<PulseCondition> &weak) {
                                    auto pulse = weak.lock();
                                    if (pulse) {
                                        pulse->discard();
                                    }
                                    return !pulse;
                                }),
                 pulses.end());
    if (pulses.empty()) {
        eventPulses_.erase(it);
    }
}

void StateMachine::addObserver(IStateMachineObserver *observer) {
    if (!observer) {
        LOG_ERROR("StateMachine: cannot add null observer");
        return;
    }

    if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) {
        LOG_DEBUG("StateMachine: observer already registered");
        return;
    }

    observers_.push_back(observer);
}

void StateMachine::removeObserver(IStateMachineObserver *observer) {
    auto it = std::find(observers_.begin(), observers_.end(), observer);
    if (it == observers_.end()) {
        LOG_DEBUG("StateMachine: observer not found for removal");
        return;
    }
    observers_.erase(it);
}

void StateMachine::setIdFormatter(IdFormatter formatter) {
    idFormatter_ = std::move(formatter);
}

std::string StateMachine::formatId(StateId id) const {
    if (idFormatter_) {
        return idFormatter_(id);
    }
    return "#" + std::to_string(id.value());
}

void StateMachine::notifyStateChanged(const std::optional<StateId> &from, StateId to) {
    // Copy: an observer may unregister itself from inside its callback
    auto observers = observers_;
    for (auto *observer : observers) {
        try {
            observer->onStateChanged(from, to);
        } catch (const std::exception &e) {
            LOG_ERROR("StateMachine: observer exception during state change notification: {}", e.what());
        }
    }
}

void StateMachine::notifyTransitionTriggered(StateId from, StateId to) {
    auto observers = observers_;
    for (auto *observer : observers) {
        try {
            observer->onTransitionTriggered(from, to);
        } catch (const std::exception &e) {
            LOG_ERROR("StateMachine: observer exception during transition notification: {}", e.what());
        }
    }
}

void StateMachine::notifyStateTimeout(StateId id) {
    auto observers = observers_;
    for (auto *observer : observers) {
        try {
            observer->onStateTimeout(id);
        } catch (const std::exception &e) {
            LOG_ERROR("StateMachine: observer exception during timeout notification: {}", e.what());
        }
    }
}

void StateMachine::notifyTimeoutBlocked(StateId id) {
    auto observers = observers_;
    for (auto *observer : observers) {
        try {
            observer->onTimeoutBlocked(id);
        } catch (const std::exception &e) {
            LOG_ERROR("StateMachine: observer exception during timeout-blocked notification: {}", e.what());
        }
    }
}

// ============================================================================
// Queries and debugging
// ============================================================================

bool StateMachine::isInStateWithTag(const std::string &tag) const {
    return currentState_ && currentState_->hasTag(tag);
}

float StateMachine::getMinStateTime() const {
    return currentState_ ? currentState_->getMinDwellTime() : 0.0f;
}

float StateMachine::getRemainingTime() const {
    if (!currentState_ || !currentState_->hasTimeout()) {
        return -1.0f;
    }
    return std::max(0.0f, currentState_->getTimeout() - stateTime_);
}

std::string StateMachine::debugCurrentTransition() const {
    std::ostringstream oss;
    oss << (previousId_ ? formatId(*previousId_) : "None") << " -> " << (currentId_ ? formatId(*currentId_) : "None");
    return oss.str();
}

std::string StateMachine::debugAllTransitions() const {
    std::ostringstream oss;
    bool first = true;
    auto appendLine = [&oss, &first](const std::string &line) {
        if (!first) {
            oss << "\n";
        }
        oss << line;
        first = false;
    };

    for (const auto &[from, list] : transitions_) {
        for (const auto &transition : list) {
            appendLine(formatId(from) + " -> " + formatId(transition->getTo()) +
                       " (Priority: " + std::to_string(transition->getPriority()) + ")");
        }
    }

    for (const auto &transition : globalTransitions_) {
        appendLine("GLOBAL -> " + formatId(transition->getTo()) +
                   " (Priority: " + std::to_string(transition->getPriority()) + ")");
    }

    return oss.str();
}

std::string StateMachine::debugAllStates() const {
    std::ostringstream oss;
    for (size_t i = 0; i < registrationOrder_.size(); ++i) {
        if (i > 0) {
            oss << "\n";
        }
        oss << formatId(registrationOrder_[i]);
    }
    return oss.str();
}

}  // namespace FSE

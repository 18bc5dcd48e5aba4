// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "model/StateId.h"
#include <optional>

namespace FSE {

/**
 * @brief Observer interface for state machine notifications
 *
 * Callbacks run synchronously on the thread driving the machine, right after
 * the event they report. Return values are not consumed. Default
 * implementations are empty so observers only override what they need
 * (sound cues, camera shake, UI).
 */
class IStateMachineObserver {
public:
    virtual ~IStateMachineObserver() = default;

    /**
     * @brief The active state changed
     * @param from Previously active state (empty when nothing was active)
     * @param to Newly active state
     */
    virtual void onStateChanged([[maybe_unused]] const std::optional<StateId> &from, [[maybe_unused]] StateId to) {}

    /**
     * @brief A conditioned or timeout transition fired during update()
     * @param from State that was left
     * @param to State that was entered
     */
    virtual void onTransitionTriggered([[maybe_unused]] StateId from, [[maybe_unused]] StateId to) {}

    /**
     * @brief A state's timeout elapsed and its restart transition is about to run
     */
    virtual void onStateTimeout([[maybe_unused]] StateId state) {}

    /**
     * @brief A state's timeout elapsed while it was fully locked
     */
    virtual void onTimeoutBlocked([[maybe_unused]] StateId state) {}
};

}  // namespace FSE

// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <functional>
#include <string>

namespace FSE {

/**
 * @brief Animation playback capability consumed by the state machine
 *
 * The machine never talks to an animation backend directly; it only calls
 * this one operation when a state carrying an AnimationConfig is entered.
 * One adapter per concrete backend (sprite player, skeletal blender, ...)
 * implements it at the boundary.
 */
class IAnimator {
public:
    virtual ~IAnimator() = default;

    /**
     * @brief Start playing an animation
     *
     * @param name Backend animation name
     * @param speed Playback speed multiplier
     * @param blend Cross-fade time in seconds (backends without blending ignore it)
     * @param loop Whether playback loops
     * @param onFinished Optional completion callback, invoked once when a non-looping clip ends
     */
    virtual void playAnimation(const std::string &name, float speed, float blend, bool loop,
                               std::function<void()> onFinished = nullptr) = 0;
};

}  // namespace FSE

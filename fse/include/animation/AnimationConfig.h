// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "animation/IAnimator.h"
#include <functional>
#include <string>

namespace FSE {

/**
 * @brief Animation descriptor stored in a state's side data
 */
struct AnimationConfig {
    std::string name;
    float speed = 1.0f;
    float customBlend = 0.0f;
    bool loop = false;
    std::function<void()> onFinished;

    /**
     * @brief Forward this descriptor to an animator
     * @param animator Target animator (nullptr is a no-op)
     */
    void play(IAnimator *animator) const {
        if (animator) {
            animator->playAnimation(name, speed, customBlend, loop, onFinished);
        }
    }
};

}  // namespace FSE

// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

namespace FSE {

/**
 * @brief RAII guard marking a StateMachine::update() call in progress
 *
 * Hooks may mutate the machine but must not tick it again; the flag lets
 * update() detect and reject that. The flag is cleared even if a hook throws.
 *
 * Usage:
 * @code
 * if (updating_) { return; }
 * UpdateGuard guard(updating_);
 * // ... run hooks and resolve transitions ...
 * @endcode
 */
class UpdateGuard {
public:
    explicit UpdateGuard(bool &flag) : flag_(flag) {
        flag_ = true;
    }

    ~UpdateGuard() noexcept {
        flag_ = false;
    }

    // Non-copyable, non-movable (RAII idiom)
    UpdateGuard(const UpdateGuard &) = delete;
    UpdateGuard &operator=(const UpdateGuard &) = delete;
    UpdateGuard(UpdateGuard &&) = delete;
    UpdateGuard &operator=(UpdateGuard &&) = delete;

private:
    bool &flag_;
};

}  // namespace FSE

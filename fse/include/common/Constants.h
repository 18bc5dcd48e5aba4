// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <climits>
#include <cstddef>

namespace FSE::Constants {

// ============================================================================
// Side data
// ============================================================================

/**
 * @brief Side-data key under which a State stores its AnimationConfig
 *
 * The machine hands the stored config to the attached IAnimator on entry.
 */
constexpr const char *ANIMATION_DATA_KEY = "Animation";

// ============================================================================
// Transition ordering
// ============================================================================

constexpr int DEFAULT_PRIORITY = 0;
constexpr int HIGHEST_PRIORITY = INT_MAX;

// ============================================================================
// Timing
// ============================================================================

/**
 * @brief Timeout value meaning "no timeout"
 *
 * Any timeout <= 0 disables the forced restart transition.
 */
constexpr float NO_TIMEOUT = -1.0f;

/**
 * @brief Minimum dwell override meaning "use the state's own floor"
 */
constexpr float NO_DWELL_OVERRIDE = -1.0f;

// ============================================================================
// Evaluator pool
// ============================================================================

/**
 * @brief Evaluators created up front by a fresh machine
 *
 * One is enough for the non-reentrant update loop; the pool grows on demand.
 */
constexpr std::size_t DEFAULT_EVALUATOR_POOL_SIZE = 1;

/**
 * @brief Candidate slots reserved in each new evaluator
 */
constexpr std::size_t EVALUATOR_RESERVED_CANDIDATES = 16;

}  // namespace FSE::Constants

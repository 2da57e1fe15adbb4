#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that stays on in release builds.
 *
 * Only for invariants whose violation means a bug in the solver itself (for
 * example a population that changed size between generations). Bad puzzles and
 * bad configs are reported through Result, never through this macro.
 *
 * Example:
 *   NONOGEN_ASSERT(population.size() == fitness.size(), "fitness must align with population");
 */
#define NONOGEN_ASSERT(condition, message)                                                  \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)

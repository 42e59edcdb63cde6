/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for agent_orchestrator interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for hot-path components.
 * These concepts enable static polymorphism with zero virtual dispatch overhead.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <string_view>

namespace agent_orchestrator {

// Forward declarations
struct ProbeContext;
struct IndicatorReading;

// ─────────────────────────────────────────────
// ProgressIndicatorLike
// ─────────────────────────────────────────────

/**
 * @concept ProgressIndicatorLike
 * @brief Constrains types that contribute one liveness signal.
 *
 * Every running task is probed by each enabled indicator once per sampling
 * interval, so indicators are plain members of the probe rather than
 * virtual objects.
 */
template <typename T>
concept ProgressIndicatorLike = requires(T indicator, const ProbeContext& ctx) {
    { indicator.probe(ctx) } -> std::same_as<IndicatorReading>;
    { T::kind() } -> std::same_as<Indicator>;
};

}  // namespace agent_orchestrator

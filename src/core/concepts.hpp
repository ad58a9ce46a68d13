/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for WorkloadRouter interfaces.
 *
 * Compile-time constraints for components used through templates (the
 * benchmark harness and the demo driver). The engine itself holds scorers
 * behind IScoringStrategy because the strategy is chosen from configuration.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <cstddef>
#include <string_view>

namespace workload_router {

// Forward declarations
struct ScoringContext;
struct ScoreCard;
struct DecisionRecord;

// ─────────────────────────────────────────────
// ScoringStrategyLike
// ─────────────────────────────────────────────

/**
 * @concept ScoringStrategyLike
 * @brief Constrains types that can rank a candidate set.
 */
template <typename T>
concept ScoringStrategyLike = requires(const T& strategy, const ScoringContext& context) {
    { strategy.score(context) } -> std::same_as<Result<ScoreCard>>;
    { strategy.kind() } -> std::same_as<ScoringStrategyKind>;
    { strategy.name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// TelemetrySourceLike
// ─────────────────────────────────────────────

/**
 * @concept TelemetrySourceLike
 * @brief Constrains types that push node telemetry into the registry.
 */
template <typename T>
concept TelemetrySourceLike = requires(T& source) {
    { source.tick() } -> std::convertible_to<size_t>;
    { source.start() } -> std::same_as<void>;
    { source.stop() } -> std::same_as<void>;
};

// ─────────────────────────────────────────────
// DecisionSinkLike
// ─────────────────────────────────────────────

/**
 * @concept DecisionSinkLike
 * @brief Constrains types that accept completed decision records.
 */
template <typename T>
concept DecisionSinkLike = requires(T& sink, const DecisionRecord& record) {
    { sink.persist(record) } -> std::same_as<Result<void>>;
};

}  // namespace workload_router

/**
 * @file decision_ledger.hpp
 * @brief Bounded in-memory decision history with aggregate statistics.
 */

#pragma once

#include "core/concepts.hpp"
#include "telemetry/decision_sink.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace workload_router {

struct NodeStatistics {
    uint64_t tasks{0};
    double average_latency_ms{0.0};
    double total_cost{0.0};
};

struct LedgerStatistics {
    uint64_t total{0};
    uint64_t successful{0};
    double success_rate{0.0};                         ///< successful / total, 0 when empty
    std::map<NodeId, NodeStatistics> per_node;
};

/**
 * @brief Keeps the most recent `limit` records; oldest are evicted first.
 *
 * Statistics are running totals over every persisted record, including
 * those already evicted from the history window.
 */
class DecisionLedger : public IDecisionSink {
public:
    explicit DecisionLedger(size_t limit = 1000);

    Result<void> persist(const DecisionRecord& record) override;

    /// Newest first, at most `limit` records, optionally for one node only.
    [[nodiscard]] std::vector<DecisionRecord> history(size_t limit = 50,
                                                      const std::optional<NodeId>& node = std::nullopt) const;

    [[nodiscard]] LedgerStatistics statistics() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return limit_; }
    void clear();

private:
    size_t limit_;
    mutable std::mutex mutex_;
    std::deque<DecisionRecord> records_;              ///< Newest at front
    LedgerStatistics totals_;                         ///< Averages filled in by statistics()
    std::map<NodeId, double> latency_totals_;
};

static_assert(DecisionSinkLike<DecisionLedger>);

}  // namespace workload_router

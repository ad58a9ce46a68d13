/**
 * @file decision_ledger.cpp
 * @brief DecisionLedger implementation.
 */

#include "telemetry/decision_ledger.hpp"

namespace workload_router {

DecisionLedger::DecisionLedger(size_t limit) : limit_(limit) {}

Result<void> DecisionLedger::persist(const DecisionRecord& record) {
    std::lock_guard lock(mutex_);

    ++totals_.total;
    if (record.outcome.success) ++totals_.successful;
    auto& node = totals_.per_node[record.decision.chosen_node];
    ++node.tasks;
    node.total_cost += record.outcome.cost;
    latency_totals_[record.decision.chosen_node] += record.outcome.latency_ms;

    if (limit_ == 0) return Result<void>{};
    records_.push_front(record);
    while (records_.size() > limit_) {
        records_.pop_back();
    }
    return Result<void>{};
}

std::vector<DecisionRecord> DecisionLedger::history(size_t limit,
                                                    const std::optional<NodeId>& node) const {
    std::lock_guard lock(mutex_);
    std::vector<DecisionRecord> out;
    for (const auto& record : records_) {
        if (out.size() >= limit) break;
        if (node && record.decision.chosen_node != *node) continue;
        out.push_back(record);
    }
    return out;
}

LedgerStatistics DecisionLedger::statistics() const {
    std::lock_guard lock(mutex_);
    LedgerStatistics stats = totals_;

    for (auto& [id, node] : stats.per_node) {
        node.average_latency_ms = latency_totals_.at(id) / static_cast<double>(node.tasks);
    }
    if (stats.total > 0) {
        stats.success_rate = static_cast<double>(stats.successful) / static_cast<double>(stats.total);
    }
    return stats;
}

size_t DecisionLedger::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

void DecisionLedger::clear() {
    std::lock_guard lock(mutex_);
    records_.clear();
    totals_ = LedgerStatistics{};
    latency_totals_.clear();
}

}  // namespace workload_router

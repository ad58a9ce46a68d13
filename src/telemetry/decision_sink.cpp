/**
 * @file decision_sink.cpp
 * @brief Decision sink implementations.
 */

#include "telemetry/decision_sink.hpp"

#include <chrono>
#include <sstream>

namespace workload_router {

namespace {

int64_t epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

}  // anonymous namespace

std::string to_json(const DecisionRecord& record) {
    const auto& d = record.decision;
    std::ostringstream oss;
    oss << R"({"event":"routing_decision")"
        << R"(,"task":")" << json_escape(d.task_id) << "\""
        << R"(,"node":")" << json_escape(d.chosen_node) << "\""
        << R"(,"category":")" << to_string(d.chosen_category) << "\""
        << R"(,"confidence":)" << d.confidence
        << R"(,"strategy":")" << to_string(d.strategy) << "\""
        << R"(,"degraded":)" << (d.degraded ? "true" : "false")
        << R"(,"decisive":")" << to_string(d.decisive_dimension) << "\""
        << R"(,"generation":)" << d.snapshot_generation
        << R"(,"decided_at_ms":)" << epoch_ms(d.decided_at)
        << R"(,"scores":{)";
    for (size_t i = 0; i < d.scores.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << json_escape(d.scores[i].node_id) << "\":" << d.scores[i].score;
    }
    oss << "}"
        << R"(,"reserved_cpu_m":)" << record.reserved.cpu_millicores
        << R"(,"reserved_mem_mb":)" << record.reserved.memory_mb
        << R"(,"stage":")" << to_string(record.final_stage) << "\""
        << R"(,"success":)" << (record.outcome.success ? "true" : "false")
        << R"(,"latency_ms":)" << record.outcome.latency_ms
        << R"(,"cost":)" << record.outcome.cost;
    if (record.outcome.error_message) {
        oss << R"(,"error":")" << json_escape(*record.outcome.error_message) << "\"";
    }
    oss << R"(,"completed_at_ms":)" << epoch_ms(record.completed_at)
        << R"(,"rationale":")" << json_escape(d.rationale) << "\""
        << "}";
    return oss.str();
}

// ── JsonDecisionSink ─────────────────────────

JsonDecisionSink::JsonDecisionSink(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

Result<void> JsonDecisionSink::persist(const DecisionRecord& record) {
    auto line = to_json(record);

    std::lock_guard lock(mutex_);
    if (!sink_->healthy()) {
        return Error{ErrorCode::Io, "Decision log unavailable for task " + record.decision.task_id};
    }
    sink_->write(line);
    if (!sink_->healthy()) {
        return Error{ErrorCode::Io, "Decision log write failed for task " + record.decision.task_id};
    }
    return Result<void>{};
}

void JsonDecisionSink::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

// ── FanOutDecisionSink ───────────────────────

void FanOutDecisionSink::add(std::shared_ptr<IDecisionSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

Result<void> FanOutDecisionSink::persist(const DecisionRecord& record) {
    std::vector<std::string> failures;
    for (const auto& sink : sinks_) {
        auto result = sink->persist(record);
        if (!result) failures.push_back(result.error().describe());
    }
    if (!failures.empty()) {
        return Error{ErrorCode::Io,
                     std::to_string(failures.size()) + " decision sink(s) failed for task "
                         + record.decision.task_id,
                     std::move(failures)};
    }
    return Result<void>{};
}

}  // namespace workload_router

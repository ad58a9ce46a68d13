/**
 * @file decision_sink.hpp
 * @brief Destinations for completed decision records.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace workload_router {

/**
 * @brief A routing decision together with how its execution went.
 */
struct DecisionRecord {
    RoutingDecision decision;
    ResourceAmount reserved;
    DecisionStage final_stage{DecisionStage::Completed};
    ExecutionOutcome outcome;
    Timestamp completed_at;
};

/// One-line NDJSON rendering of a record.
[[nodiscard]] std::string to_json(const DecisionRecord& record);

/**
 * @brief Abstract persistence/observability collaborator.
 *
 * A failing sink never fails the task; the engine logs the error and moves on.
 */
class IDecisionSink {
public:
    virtual ~IDecisionSink() = default;
    virtual Result<void> persist(const DecisionRecord& record) = 0;
};

/**
 * @brief Writes each record as an NDJSON line through an ILogSink.
 */
class JsonDecisionSink : public IDecisionSink {
public:
    explicit JsonDecisionSink(std::unique_ptr<ILogSink> sink);

    Result<void> persist(const DecisionRecord& record) override;
    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex mutex_;
};

/**
 * @brief Forwards every record to each child sink.
 *
 * All children are attempted even when one fails; the combined error lists
 * every failure.
 */
class FanOutDecisionSink : public IDecisionSink {
public:
    void add(std::shared_ptr<IDecisionSink> sink);
    Result<void> persist(const DecisionRecord& record) override;

    [[nodiscard]] size_t size() const noexcept { return sinks_.size(); }

private:
    std::vector<std::shared_ptr<IDecisionSink>> sinks_;
};

}  // namespace workload_router

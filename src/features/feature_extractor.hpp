/**
 * @file feature_extractor.hpp
 * @brief Maps a task and a snapshot to the classifier's input vector.
 *
 * Schema v1 (fixed order, width 8):
 *   0 priority              1–10
 *   1 latency_requirement   ordinal 1–10 (millisecond ceilings bucketed)
 *   2 requires_gpu          0/1
 *   3 edge_load             mean effective CPU load %, 50 if no such node
 *   4 cloud_load            "
 *   5 gpu_load              "
 *   6 network_latency       ambient network latency, ms
 *   7 cost_sensitivity      1–10
 *
 * A classifier artifact pins the schema version and width it was trained
 * against; check_compatible() rejects any skew.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/metrics_snapshot.hpp"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace workload_router {

enum class Feature : size_t {
    Priority,
    LatencyRequirement,
    RequiresGpu,
    EdgeLoad,
    CloudLoad,
    GpuLoad,
    NetworkLatency,
    CostSensitivity
};

inline constexpr uint32_t kFeatureSchemaVersion = 1;

inline constexpr std::array<std::string_view, 8> kFeatureNames = {
    "priority", "latency_requirement", "requires_gpu", "edge_load",
    "cloud_load", "gpu_load", "network_latency", "cost_sensitivity"
};

inline constexpr size_t kFeatureWidth = kFeatureNames.size();

struct FeatureVector {
    uint32_t schema_version{kFeatureSchemaVersion};
    std::vector<double> values;

    [[nodiscard]] double operator[](Feature feature) const {
        return values.at(static_cast<size_t>(feature));
    }

    [[nodiscard]] size_t width() const noexcept { return values.size(); }

    bool operator==(const FeatureVector&) const = default;
};

/**
 * @brief Pure, deterministic feature extraction.
 */
class FeatureExtractor {
public:
    static constexpr double kMissingCategoryLoad = 50.0;

    [[nodiscard]] static FeatureVector extract(const TaskDescriptor& task,
                                               const MetricsSnapshot& snapshot);

    /// Fails with SchemaMismatch unless version and width match schema v1.
    static Result<void> check_compatible(uint32_t schema_version, size_t input_width);

    [[nodiscard]] static std::string_view feature_name(Feature feature) noexcept {
        return kFeatureNames[static_cast<size_t>(feature)];
    }
};

}  // namespace workload_router

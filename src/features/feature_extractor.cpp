/**
 * @file feature_extractor.cpp
 * @brief FeatureExtractor implementation.
 */

#include "features/feature_extractor.hpp"

#include <format>

namespace workload_router {

FeatureVector FeatureExtractor::extract(const TaskDescriptor& task,
                                        const MetricsSnapshot& snapshot) {
    auto category_load = [&snapshot](NodeCategory category) {
        return snapshot.average_load_percent(category).value_or(kMissingCategoryLoad);
    };

    FeatureVector features;
    features.values = {
        static_cast<double>(task.priority),
        static_cast<double>(task.latency_ordinal()),
        task.requires_gpu ? 1.0 : 0.0,
        category_load(NodeCategory::Edge),
        category_load(NodeCategory::Cloud),
        category_load(NodeCategory::Gpu),
        snapshot.environment.network_latency_ms,
        static_cast<double>(task.cost_sensitivity)
    };
    return features;
}

Result<void> FeatureExtractor::check_compatible(uint32_t schema_version, size_t input_width) {
    if (schema_version != kFeatureSchemaVersion) {
        return Error{ErrorCode::SchemaMismatch,
                     std::format("Feature schema v{} expected, classifier pinned to v{}",
                                 kFeatureSchemaVersion, schema_version)};
    }
    if (input_width != kFeatureWidth) {
        return Error{ErrorCode::SchemaMismatch,
                     std::format("Feature width {} expected, classifier accepts {}",
                                 kFeatureWidth, input_width)};
    }
    return Result<void>{};
}

}  // namespace workload_router

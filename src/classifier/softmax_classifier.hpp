/**
 * @file softmax_classifier.hpp
 * @brief Multinomial logistic-regression classifier loaded from a TOML artifact.
 *
 * Artifact layout:
 *
 *   [model]
 *   name = "router-softmax"
 *   version = "1.0.0"
 *   schema_version = 1
 *   classes = ["edge", "cloud", "gpu"]
 *   feature_mean = [...]            # optional, width entries
 *   feature_scale = [...]           # optional, width entries, non-zero
 *   weights = [[...], [...], [...]] # one row per class, width entries each
 *   bias = [...]                    # one per class
 */

#pragma once

#include "classifier/routing_classifier.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace workload_router {

struct SoftmaxModel {
    std::string name;
    std::string version;
    uint32_t schema_version{0};
    std::vector<std::string> classes;
    std::vector<double> feature_mean;
    std::vector<double> feature_scale;
    std::vector<std::vector<double>> weights;
    std::vector<double> bias;
};

class SoftmaxClassifier : public IRoutingClassifier {
public:
    /// Validates shapes; any inconsistency is an InvalidConfig error.
    static Result<std::shared_ptr<SoftmaxClassifier>> create(SoftmaxModel model);

    Result<std::vector<double>> predict_proba(std::span<const double> features) const override;

    [[nodiscard]] const std::vector<std::string>& classes() const noexcept override {
        return model_.classes;
    }
    [[nodiscard]] uint32_t schema_version() const noexcept override { return model_.schema_version; }
    [[nodiscard]] size_t input_width() const noexcept override { return width_; }
    [[nodiscard]] std::string_view version() const noexcept override { return model_.version; }
    [[nodiscard]] std::string_view name() const noexcept { return model_.name; }

private:
    explicit SoftmaxClassifier(SoftmaxModel model);

    SoftmaxModel model_;
    size_t width_;
};

/**
 * @brief Load a classifier artifact from disk.
 *
 * Missing files are Io errors; malformed artifacts are InvalidConfig errors.
 */
Result<std::shared_ptr<const IRoutingClassifier>> load_classifier_artifact(
    const std::filesystem::path& path);

/**
 * @brief Parse a classifier artifact from TOML text.
 */
Result<std::shared_ptr<const IRoutingClassifier>> parse_classifier_artifact(std::string_view toml_text);

}  // namespace workload_router

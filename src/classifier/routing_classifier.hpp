/**
 * @file routing_classifier.hpp
 * @brief Interface of a pre-fitted multi-class node-category predictor.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace workload_router {

/**
 * @brief A trained, versioned predictor: feature vector → probability
 *        distribution over its class labels.
 *
 * Labels are node category names ("edge", "cloud", "gpu"). Training is
 * out of scope; implementations are loaded from artifacts and immutable,
 * so predict_proba() may be called concurrently.
 */
class IRoutingClassifier {
public:
    virtual ~IRoutingClassifier() = default;

    /// One probability per entry of classes(), summing to 1.
    virtual Result<std::vector<double>> predict_proba(std::span<const double> features) const = 0;

    [[nodiscard]] virtual const std::vector<std::string>& classes() const noexcept = 0;
    [[nodiscard]] virtual uint32_t schema_version() const noexcept = 0;
    [[nodiscard]] virtual size_t input_width() const noexcept = 0;
    [[nodiscard]] virtual std::string_view version() const noexcept = 0;
};

}  // namespace workload_router

/**
 * @file softmax_classifier.cpp
 * @brief SoftmaxClassifier implementation and TOML artifact loading.
 */

#include "classifier/softmax_classifier.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_set>

namespace workload_router {

namespace {

Error artifact_error(std::string message) {
    return Error{ErrorCode::InvalidConfig, "Classifier artifact: " + std::move(message)};
}

Result<std::vector<double>> read_numbers(const toml::array* array, std::string_view field) {
    if (!array) {
        return artifact_error(std::format("'{}' must be an array of numbers", field));
    }
    std::vector<double> values;
    values.reserve(array->size());
    for (const auto& element : *array) {
        auto number = element.value<double>();
        if (!number) {
            return artifact_error(std::format("'{}' contains a non-numeric entry", field));
        }
        values.push_back(*number);
    }
    return values;
}

Result<std::shared_ptr<const IRoutingClassifier>> from_table(const toml::table& tbl) {
    const auto* model_tbl = tbl["model"].as_table();
    if (!model_tbl) {
        return artifact_error("missing [model] table");
    }
    const auto& m = *model_tbl;

    SoftmaxModel model;
    model.name = m["name"].value_or(std::string{"unnamed"});
    model.version = m["version"].value_or(std::string{"0"});

    auto schema = m["schema_version"].value<int64_t>();
    if (!schema || *schema < 0) {
        return artifact_error("missing or invalid 'schema_version'");
    }
    model.schema_version = static_cast<uint32_t>(*schema);

    if (const auto* classes = m["classes"].as_array()) {
        for (const auto& element : *classes) {
            auto label = element.value<std::string>();
            if (!label) return artifact_error("'classes' must contain strings");
            model.classes.push_back(*label);
        }
    } else {
        return artifact_error("missing 'classes'");
    }

    if (const auto* rows = m["weights"].as_array()) {
        for (const auto& row : *rows) {
            auto values = read_numbers(row.as_array(), "weights");
            if (!values) return values.error();
            model.weights.push_back(std::move(*values));
        }
    } else {
        return artifact_error("missing 'weights'");
    }

    auto bias = read_numbers(m["bias"].as_array(), "bias");
    if (!bias) return bias.error();
    model.bias = std::move(*bias);

    if (m.contains("feature_mean")) {
        auto mean = read_numbers(m["feature_mean"].as_array(), "feature_mean");
        if (!mean) return mean.error();
        model.feature_mean = std::move(*mean);
    }
    if (m.contains("feature_scale")) {
        auto scale = read_numbers(m["feature_scale"].as_array(), "feature_scale");
        if (!scale) return scale.error();
        model.feature_scale = std::move(*scale);
    }

    auto classifier = SoftmaxClassifier::create(std::move(model));
    if (!classifier) return classifier.error();
    return std::shared_ptr<const IRoutingClassifier>(std::move(*classifier));
}

}  // anonymous namespace

SoftmaxClassifier::SoftmaxClassifier(SoftmaxModel model)
    : model_(std::move(model)), width_(model_.weights.front().size()) {}

Result<std::shared_ptr<SoftmaxClassifier>> SoftmaxClassifier::create(SoftmaxModel model) {
    if (model.classes.empty()) {
        return artifact_error("no classes");
    }
    std::unordered_set<std::string> seen;
    for (const auto& label : model.classes) {
        if (!seen.insert(label).second) {
            return artifact_error("duplicate class '" + label + "'");
        }
    }
    if (model.weights.size() != model.classes.size()) {
        return artifact_error(std::format("{} weight rows for {} classes",
                                          model.weights.size(), model.classes.size()));
    }
    size_t width = model.weights.front().size();
    if (width == 0) {
        return artifact_error("weight rows are empty");
    }
    for (const auto& row : model.weights) {
        if (row.size() != width) {
            return artifact_error("weight rows have differing widths");
        }
    }
    if (model.bias.size() != model.classes.size()) {
        return artifact_error(std::format("{} bias terms for {} classes",
                                          model.bias.size(), model.classes.size()));
    }
    if (!model.feature_mean.empty() && model.feature_mean.size() != width) {
        return artifact_error("'feature_mean' width does not match weights");
    }
    if (!model.feature_scale.empty()) {
        if (model.feature_scale.size() != width) {
            return artifact_error("'feature_scale' width does not match weights");
        }
        if (std::any_of(model.feature_scale.begin(), model.feature_scale.end(),
                        [](double s) { return s == 0.0; })) {
            return artifact_error("'feature_scale' contains zero");
        }
    }

    return std::shared_ptr<SoftmaxClassifier>(new SoftmaxClassifier(std::move(model)));
}

Result<std::vector<double>> SoftmaxClassifier::predict_proba(std::span<const double> features) const {
    if (features.size() != width_) {
        return Error{ErrorCode::SchemaMismatch,
                     std::format("Classifier {} expects {} features, got {}",
                                 model_.version, width_, features.size())};
    }

    std::vector<double> standardized(features.begin(), features.end());
    for (size_t i = 0; i < width_; ++i) {
        if (!std::isfinite(standardized[i])) {
            return Error{ErrorCode::ClassifierUnavailable,
                         std::format("Non-finite feature at index {}", i)};
        }
        if (!model_.feature_mean.empty()) standardized[i] -= model_.feature_mean[i];
        if (!model_.feature_scale.empty()) standardized[i] /= model_.feature_scale[i];
    }

    std::vector<double> logits(model_.classes.size());
    for (size_t c = 0; c < logits.size(); ++c) {
        double z = model_.bias[c];
        for (size_t i = 0; i < width_; ++i) {
            z += model_.weights[c][i] * standardized[i];
        }
        logits[c] = z;
    }

    // Numerically stable softmax
    double max_logit = *std::max_element(logits.begin(), logits.end());
    double total = 0.0;
    for (auto& value : logits) {
        value = std::exp(value - max_logit);
        total += value;
    }
    for (auto& value : logits) {
        value /= total;
    }
    return logits;
}

Result<std::shared_ptr<const IRoutingClassifier>> load_classifier_artifact(
    const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Classifier artifact not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"Classifier artifact parse error: "} + std::string{err.description()}};
    }
}

Result<std::shared_ptr<const IRoutingClassifier>> parse_classifier_artifact(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"Classifier artifact parse error: "} + std::string{err.description()}};
    }
}

}  // namespace workload_router

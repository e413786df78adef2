#pragma once

/// @file metric_factory.h
/// @brief Build metrics from YAML specifications
///
/// A spec is a map with a `type` key and the metric's parameters alongside:
///
/// @code
///   evaluation:
///     metrics:
///       - type: levenshtein
///       - type: bleu
///         max_n: 2
///       - type: regex_match
///         pattern: "^\\d+$"
///       - type: weighted
///         weight: 0.5
///         metric: {type: rouge_l, beta: 1.2}
///       - type: composite
///         name: overlap
///         metrics:
///           - {type: jaccard_similarity}
///           - {type: cosine_similarity}
/// @endcode

#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "common/config.h"
#include "evaluation/metric.h"

namespace evalkit::eval {

/// @brief Create one metric from its spec
/// @return InvalidArgument for an unknown type, a missing required
///         parameter, a parameter of the wrong type or a bad regex
absl::StatusOr<MetricPtr> CreateMetric(const YAML::Node& spec);

/// @brief Create every metric listed under `evaluation.metrics`
///
/// A missing key yields an empty list; anything other than a sequence is
/// rejected.
absl::StatusOr<std::vector<MetricPtr>> CreateMetrics(const Config& config);

/// @brief Metric types CreateMetric() understands, sorted
std::vector<std::string> SupportedMetricTypes();

}  // namespace evalkit::eval

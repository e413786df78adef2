#pragma once

/// @file engine.h
/// @brief Evaluation engine: runs metrics over inputs, sequentially or with
///        a bounded number of concurrent workers

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "evaluation/context.h"
#include "evaluation/metric.h"
#include "evaluation/metric_input.h"
#include "evaluation/score.h"

namespace evalkit::eval {

/// @brief Scores of every metric for one item
///
/// `error` is set only when the engine stopped the item early (cancelled
/// context); failed individual scores do not fail the item.
struct EvaluationResult {
    std::string item_id;
    MetricInput input;
    ScoreResults scores;
    absl::Status error;

    bool IsSuccess() const { return error.ok(); }

    /// @brief Mean of the successful scores
    double AverageScore() const { return scores.Average(); }

    nlohmann::json ToJson() const;
};

/// @brief Ordered collection of evaluation records
class EvaluationResults {
public:
    using const_iterator = std::vector<EvaluationResult>::const_iterator;

    EvaluationResults() = default;
    explicit EvaluationResults(std::vector<EvaluationResult> results);

    void Add(EvaluationResult result) { results_.push_back(std::move(result)); }

    size_t size() const { return results_.size(); }
    bool empty() const { return results_.empty(); }
    const EvaluationResult& operator[](size_t i) const { return results_[i]; }
    const_iterator begin() const { return results_.begin(); }
    const_iterator end() const { return results_.end(); }

    EvaluationResults Successful() const;
    EvaluationResults Failed() const;

    /// @brief Cross-item mean for one metric
    ///
    /// Each item contributes its first score with that name, and only if
    /// that score succeeded. Returns 0 when no item contributes.
    double AverageByMetric(const std::string& metric_name) const;

    /// @brief AverageByMetric() for every metric name seen in any item
    std::map<std::string, double> Summary() const;

    /// @brief {"items": [...], "summary": {...}}
    nlohmann::json ToJson() const;

private:
    std::vector<EvaluationResult> results_;
};

/// @brief Progress hook: completed count (1-based), total, finished record
///
/// Invocations are serialized; a callback never runs concurrently with
/// another callback of the same batch. Callbacks must not throw.
using ProgressCallback =
    std::function<void(int completed, int total, const EvaluationResult& result)>;

/// @brief Engine construction options
struct EngineOptions {
    /// Maximum number of items evaluated at once (1 = sequential)
    int concurrency = 1;

    /// Called once per finished item, in registration order
    std::vector<ProgressCallback> callbacks;

    /// @brief Set concurrency; values <= 0 are ignored
    EngineOptions& WithConcurrency(int n);

    /// @brief Append a progress callback
    EngineOptions& WithCallback(ProgressCallback callback);
};

/// @brief Runs an ordered list of metrics against inputs
///
/// Example:
/// @code
///   Engine engine({std::make_shared<heuristic::Bleu>()},
///                 EngineOptions().WithConcurrency(4));
///   auto results = engine.EvaluateMany(*EvalContext::Background(), inputs);
///   double bleu = results.AverageByMetric("bleu");
/// @endcode
class Engine {
public:
    explicit Engine(std::vector<MetricPtr> metrics, EngineOptions options = {});

    /// @brief Build an engine whose concurrency comes from
    ///        `evaluation.concurrency` in the configuration
    static Engine FromConfig(std::vector<MetricPtr> metrics,
                             const Config& config,
                             std::vector<ProgressCallback> callbacks = {});

    /// @brief Score one input with every metric, in order
    ///
    /// The context is checked before each metric. Once it is done, the
    /// record carries the context error and only the scores computed so far.
    EvaluationResult EvaluateOne(const EvalContext& ctx, const MetricInput& input) const;

    /// @brief Score a batch; result i belongs to inputs[i] with id "item-<i>"
    EvaluationResults EvaluateMany(const EvalContext& ctx,
                                   const std::vector<MetricInput>& inputs) const;

    /// @brief Score inputs keyed by caller-supplied ids
    ///
    /// Every id appears exactly once in the result; result order is
    /// unspecified.
    EvaluationResults EvaluateWithIds(
        const EvalContext& ctx,
        const std::unordered_map<std::string, MetricInput>& items) const;

    const std::vector<MetricPtr>& Metrics() const { return metrics_; }

    int Concurrency() const { return concurrency_; }

private:
    using BatchItem = std::pair<std::string, const MetricInput*>;

    EvaluationResults RunBatch(const EvalContext& ctx,
                               const std::vector<BatchItem>& items) const;
    EvaluationResults RunSequential(const EvalContext& ctx,
                                    const std::vector<BatchItem>& items) const;
    EvaluationResults RunConcurrent(const EvalContext& ctx,
                                    const std::vector<BatchItem>& items) const;

    void NotifyCallbacks(int completed, int total, const EvaluationResult& result) const;

    std::vector<MetricPtr> metrics_;
    int concurrency_ = 1;
    std::vector<ProgressCallback> callbacks_;
};

/// @brief One-shot batch evaluation
EvaluationResults Evaluate(const EvalContext& ctx,
                           std::vector<MetricPtr> metrics,
                           const std::vector<MetricInput>& inputs,
                           EngineOptions options = {});

/// @brief One-shot single-item evaluation
EvaluationResult EvaluateSingle(const EvalContext& ctx,
                                std::vector<MetricPtr> metrics,
                                const MetricInput& input);

}  // namespace evalkit::eval

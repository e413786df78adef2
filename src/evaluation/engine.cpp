#include "evaluation/engine.h"

#include <algorithm>
#include <exception>
#include <limits>
#include <mutex>
#include <set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/worker_pool.h"

namespace evalkit::eval {

// ============================================================================
// EvaluationResult / EvaluationResults
// ============================================================================

nlohmann::json EvaluationResult::ToJson() const {
    nlohmann::json j;
    j["item_id"] = item_id;
    j["input"] = {
        {"input", input.Input()},
        {"output", input.Output()},
        {"expected", input.Expected()},
        {"context", input.Context()},
        {"metadata", input.Metadata()},
    };
    j["scores"] = scores.ToJson();
    j["average_score"] = AverageScore();
    if (!error.ok()) {
        j["error"] = error.ToString();
    }
    return j;
}

EvaluationResults::EvaluationResults(std::vector<EvaluationResult> results)
    : results_(std::move(results)) {}

EvaluationResults EvaluationResults::Successful() const {
    EvaluationResults out;
    for (const auto& result : results_) {
        if (result.IsSuccess()) {
            out.Add(result);
        }
    }
    return out;
}

EvaluationResults EvaluationResults::Failed() const {
    EvaluationResults out;
    for (const auto& result : results_) {
        if (!result.IsSuccess()) {
            out.Add(result);
        }
    }
    return out;
}

double EvaluationResults::AverageByMetric(const std::string& metric_name) const {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& result : results_) {
        const ScoreResult* score = result.scores.ByName(metric_name);
        if (score != nullptr && score->IsSuccess()) {
            sum += score->value;
            ++count;
        }
    }
    if (count == 0) {
        return 0.0;
    }
    return sum / static_cast<double>(count);
}

std::map<std::string, double> EvaluationResults::Summary() const {
    std::set<std::string> metric_names;
    for (const auto& result : results_) {
        for (const auto& score : result.scores) {
            metric_names.insert(score.name);
        }
    }

    std::map<std::string, double> summary;
    for (const auto& name : metric_names) {
        summary[name] = AverageByMetric(name);
    }
    return summary;
}

nlohmann::json EvaluationResults::ToJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : results_) {
        items.push_back(result.ToJson());
    }

    nlohmann::json j;
    j["items"] = std::move(items);
    j["summary"] = Summary();
    j["total"] = results_.size();
    j["failed"] = Failed().size();
    return j;
}

// ============================================================================
// EngineOptions
// ============================================================================

EngineOptions& EngineOptions::WithConcurrency(int n) {
    if (n > 0) {
        concurrency = n;
    }
    return *this;
}

EngineOptions& EngineOptions::WithCallback(ProgressCallback callback) {
    callbacks.push_back(std::move(callback));
    return *this;
}

// ============================================================================
// Engine
// ============================================================================

Engine::Engine(std::vector<MetricPtr> metrics, EngineOptions options)
    : metrics_(std::move(metrics)),
      callbacks_(std::move(options.callbacks)) {
    if (options.concurrency > 0) {
        concurrency_ = options.concurrency;
    }
}

Engine Engine::FromConfig(std::vector<MetricPtr> metrics,
                          const Config& config,
                          std::vector<ProgressCallback> callbacks) {
    EngineOptions options;
    const int64_t concurrency = config.GetInt("evaluation.concurrency", 1);
    if (concurrency > 0) {
        options.WithConcurrency(static_cast<int>(
            std::min<int64_t>(concurrency, std::numeric_limits<int>::max())));
    }
    options.callbacks = std::move(callbacks);
    return Engine(std::move(metrics), std::move(options));
}

EvaluationResult Engine::EvaluateOne(const EvalContext& ctx, const MetricInput& input) const {
    EvaluationResult result;
    result.input = input;
    result.scores.Reserve(metrics_.size());

    for (const auto& metric : metrics_) {
        if (ctx.Done()) {
            result.error = ctx.Err();
            EVALKIT_LOG_DEBUG("Evaluation stopped after {}/{} metrics: {}",
                              result.scores.size(), metrics_.size(),
                              std::string(result.error.message()));
            return result;
        }

        try {
            result.scores.Add(metric->Score(ctx, input));
        } catch (const std::exception& e) {
            // A throwing metric is reported like any other metric failure
            EVALKIT_LOG_ERROR("Metric '{}' threw: {}", metric->Name(), e.what());
            result.scores.Add(ScoreResult::Failure(
                metric->Name(),
                InternalError(absl::StrCat("metric threw: ", e.what()))));
        }
    }

    return result;
}

EvaluationResults Engine::EvaluateMany(const EvalContext& ctx,
                                       const std::vector<MetricInput>& inputs) const {
    std::vector<BatchItem> items;
    items.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        items.emplace_back(absl::StrCat("item-", i), &inputs[i]);
    }
    return RunBatch(ctx, items);
}

EvaluationResults Engine::EvaluateWithIds(
    const EvalContext& ctx,
    const std::unordered_map<std::string, MetricInput>& items) const {
    std::vector<BatchItem> batch;
    batch.reserve(items.size());
    for (const auto& [id, input] : items) {
        batch.emplace_back(id, &input);
    }
    return RunBatch(ctx, batch);
}

EvaluationResults Engine::RunBatch(const EvalContext& ctx,
                                   const std::vector<BatchItem>& items) const {
    if (items.empty()) {
        return EvaluationResults();
    }

    EVALKIT_LOG_DEBUG("Evaluating {} items with {} metrics (concurrency {})",
                      items.size(), metrics_.size(), concurrency_);

    EvaluationResults results = concurrency_ <= 1
        ? RunSequential(ctx, items)
        : RunConcurrent(ctx, items);

    const size_t failed = results.Failed().size();
    const absl::Status ctx_status = ctx.Err();
    if (failed > 0 && IsContextError(ctx_status)) {
        EVALKIT_LOG_WARN("{} of {} items did not finish: {}",
                         failed, items.size(), std::string(ctx_status.message()));
    } else if (failed > 0) {
        EVALKIT_LOG_WARN("{} of {} items failed", failed, items.size());
    } else {
        EVALKIT_LOG_DEBUG("Evaluated {} items", items.size());
    }
    return results;
}

EvaluationResults Engine::RunSequential(const EvalContext& ctx,
                                        const std::vector<BatchItem>& items) const {
    const int total = static_cast<int>(items.size());
    std::vector<EvaluationResult> slots(items.size());

    for (size_t i = 0; i < items.size(); ++i) {
        slots[i] = EvaluateOne(ctx, *items[i].second);
        slots[i].item_id = items[i].first;
        NotifyCallbacks(static_cast<int>(i) + 1, total, slots[i]);
    }

    return EvaluationResults(std::move(slots));
}

EvaluationResults Engine::RunConcurrent(const EvalContext& ctx,
                                        const std::vector<BatchItem>& items) const {
    const int total = static_cast<int>(items.size());
    std::vector<EvaluationResult> slots(items.size());

    // Guards the completion counter and callback dispatch. Slot writes are
    // disjoint but happen under the same lock so a callback sees its record
    // already published.
    std::mutex publish_mutex;
    int completed = 0;

    {
        WorkerPool pool(std::min(static_cast<size_t>(concurrency_), items.size()));

        for (size_t i = 0; i < items.size(); ++i) {
            pool.Execute([this, &ctx, &items, &slots, &publish_mutex, &completed, total, i]() {
                EvaluationResult result = EvaluateOne(ctx, *items[i].second);
                result.item_id = items[i].first;

                std::lock_guard<std::mutex> lock(publish_mutex);
                slots[i] = std::move(result);
                ++completed;
                NotifyCallbacks(completed, total, slots[i]);
            });
        }

        pool.Wait();
    }

    return EvaluationResults(std::move(slots));
}

void Engine::NotifyCallbacks(int completed, int total, const EvaluationResult& result) const {
    for (const auto& callback : callbacks_) {
        callback(completed, total, result);
    }
}

// ============================================================================
// Convenience functions
// ============================================================================

EvaluationResults Evaluate(const EvalContext& ctx,
                           std::vector<MetricPtr> metrics,
                           const std::vector<MetricInput>& inputs,
                           EngineOptions options) {
    Engine engine(std::move(metrics), std::move(options));
    return engine.EvaluateMany(ctx, inputs);
}

EvaluationResult EvaluateSingle(const EvalContext& ctx,
                                std::vector<MetricPtr> metrics,
                                const MetricInput& input) {
    Engine engine(std::move(metrics));
    return engine.EvaluateOne(ctx, input);
}

}  // namespace evalkit::eval

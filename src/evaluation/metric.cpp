#include "evaluation/metric.h"

namespace evalkit::eval {

FunctionMetric::FunctionMetric(std::string name, ScoreFn fn)
    : NamedMetric(std::move(name)), fn_(std::move(fn)) {}

ScoreResult FunctionMetric::Score(const EvalContext& ctx, const MetricInput& input) const {
    return fn_(ctx, input);
}

CompositeMetric::CompositeMetric(std::string name, std::vector<MetricPtr> metrics)
    : NamedMetric(std::move(name)), metrics_(std::move(metrics)) {}

ScoreResult CompositeMetric::Score(const EvalContext& ctx, const MetricInput& input) const {
    return ScoreResult::Success(Name(), ScoreAll(ctx, input).Average());
}

ScoreResults CompositeMetric::ScoreAll(const EvalContext& ctx, const MetricInput& input) const {
    ScoreResults scores;
    scores.Reserve(metrics_.size());
    for (const auto& metric : metrics_) {
        scores.Add(metric->Score(ctx, input));
    }
    return scores;
}

ConditionalMetric::ConditionalMetric(std::string name, Predicate condition, MetricPtr metric)
    : NamedMetric(std::move(name)),
      condition_(std::move(condition)),
      metric_(std::move(metric)) {}

ScoreResult ConditionalMetric::Score(const EvalContext& ctx, const MetricInput& input) const {
    if (!condition_(input)) {
        return ScoreResult::WithReason(Name(), 0.0, "condition not met");
    }
    return metric_->Score(ctx, input);
}

WeightedMetric::WeightedMetric(MetricPtr metric, double weight)
    : metric_(std::move(metric)), weight_(weight) {}

ScoreResult WeightedMetric::Score(const EvalContext& ctx, const MetricInput& input) const {
    ScoreResult result = metric_->Score(ctx, input);
    if (!result.IsSuccess()) {
        return result;
    }
    result.value *= weight_;
    return result;
}

}  // namespace evalkit::eval

#pragma once

/// @file metric.h
/// @brief Metric interface and the function/composite/conditional/weighted
///        combinators

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "evaluation/context.h"
#include "evaluation/metric_input.h"
#include "evaluation/score.h"

namespace evalkit::eval {

/// @brief A named scoring function over a MetricInput
///
/// Score() is called concurrently from engine workers and must not mutate
/// shared state without synchronization. Failures are reported through
/// ScoreResult::error, not by throwing.
class Metric {
public:
    virtual ~Metric() = default;

    virtual std::string Name() const = 0;

    virtual ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const = 0;
};

using MetricPtr = std::shared_ptr<const Metric>;

/// @brief Base for metrics whose name is fixed at construction
class NamedMetric : public Metric {
public:
    explicit NamedMetric(std::string name) : name_(std::move(name)) {}

    std::string Name() const override { return name_; }

private:
    std::string name_;
};

/// @brief Metric backed by an arbitrary callable
class FunctionMetric : public NamedMetric {
public:
    using ScoreFn = std::function<ScoreResult(const EvalContext&, const MetricInput&)>;

    FunctionMetric(std::string name, ScoreFn fn);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    ScoreFn fn_;
};

/// @brief Averages its children into one score named after itself
///
/// Children are scored in registration order. Failed children are left out
/// of the mean; if none succeed the value is 0. The composite itself never
/// fails.
class CompositeMetric : public NamedMetric {
public:
    CompositeMetric(std::string name, std::vector<MetricPtr> metrics);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

    /// @brief Raw per-child results, in registration order
    ScoreResults ScoreAll(const EvalContext& ctx, const MetricInput& input) const;

    const std::vector<MetricPtr>& Metrics() const { return metrics_; }

private:
    std::vector<MetricPtr> metrics_;
};

/// @brief Delegates to an inner metric only when a predicate holds
///
/// When the predicate is false the inner metric is not invoked and the
/// result is a 0 score under this metric's own name with reason
/// "condition not met". When it is true the inner result is returned as is,
/// including the inner metric's name.
class ConditionalMetric : public NamedMetric {
public:
    using Predicate = std::function<bool(const MetricInput&)>;

    ConditionalMetric(std::string name, Predicate condition, MetricPtr metric);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    Predicate condition_;
    MetricPtr metric_;
};

/// @brief Scales the value of a wrapped metric
///
/// Reports the wrapped metric's name. A failed inner result is passed
/// through without weighting.
class WeightedMetric : public Metric {
public:
    WeightedMetric(MetricPtr metric, double weight);

    std::string Name() const override { return metric_->Name(); }

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

    double Weight() const { return weight_; }

private:
    MetricPtr metric_;
    double weight_;
};

}  // namespace evalkit::eval

#pragma once

/// @file string_metrics.h
/// @brief Exact-string and length checks on model output

#include <cstddef>
#include <string>
#include <vector>

#include "evaluation/metric.h"

namespace evalkit::eval::heuristic {

/// @brief 1.0 when output equals expected ("equals")
class Equals : public NamedMetric {
public:
    explicit Equals(bool case_sensitive = true);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
};

/// @brief 1.0 when output contains expected ("contains")
class Contains : public NamedMetric {
public:
    explicit Contains(bool case_sensitive = true);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
};

/// @brief 1.0 when output starts with expected ("starts_with")
class StartsWith : public NamedMetric {
public:
    explicit StartsWith(bool case_sensitive = true);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
};

/// @brief 1.0 when output ends with expected ("ends_with")
class EndsWith : public NamedMetric {
public:
    explicit EndsWith(bool case_sensitive = true);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
};

/// @brief 1.0 when output contains at least one of the values ("contains_any")
class ContainsAny : public NamedMetric {
public:
    explicit ContainsAny(std::vector<std::string> values, bool case_sensitive = true);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    std::vector<std::string> values_;
    bool case_sensitive_;
};

/// @brief Fraction of the values found in output ("contains_all")
///
/// The reason lists the missing values when the score is below 1.
class ContainsAll : public NamedMetric {
public:
    explicit ContainsAll(std::vector<std::string> values, bool case_sensitive = true);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    std::vector<std::string> values_;
    bool case_sensitive_;
};

/// @brief 1.0 when output has a non-whitespace character ("not_empty")
class NotEmpty : public NamedMetric {
public:
    NotEmpty();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief 1.0 when the output byte length is in [min, max] ("length_between")
class LengthBetween : public NamedMetric {
public:
    LengthBetween(size_t min_length, size_t max_length);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    size_t min_length_;
    size_t max_length_;
};

/// @brief 1.0 when the output word count is in [min, max] ("word_count")
class WordCount : public NamedMetric {
public:
    WordCount(size_t min_words, size_t max_words);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    size_t min_words_;
    size_t max_words_;
};

/// @brief 0.0 when output contains any listed pattern, case-insensitively
///        ("no_offensive_language")
class NoOffensiveLanguage : public NamedMetric {
public:
    explicit NoOffensiveLanguage(std::vector<std::string> patterns);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    std::vector<std::string> patterns_;
};

}  // namespace evalkit::eval::heuristic

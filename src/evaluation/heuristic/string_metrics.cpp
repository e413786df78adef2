#include "evaluation/heuristic/string_metrics.h"

#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "evaluation/heuristic/text.h"

namespace evalkit::eval::heuristic {

namespace {

// Output and expected, lower-cased unless the comparison is case sensitive
std::pair<std::string, std::string> Normalize(const MetricInput& input, bool case_sensitive) {
    if (case_sensitive) {
        return {input.Output(), input.Expected()};
    }
    return {ToLower(input.Output()), ToLower(input.Expected())};
}

}  // namespace

Equals::Equals(bool case_sensitive)
    : NamedMetric("equals"), case_sensitive_(case_sensitive) {}

ScoreResult Equals::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const auto [output, expected] = Normalize(input, case_sensitive_);
    if (output == expected) {
        return BooleanScore(Name(), true, "exact match");
    }
    return BooleanScore(Name(), false, "no match");
}

Contains::Contains(bool case_sensitive)
    : NamedMetric("contains"), case_sensitive_(case_sensitive) {}

ScoreResult Contains::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const auto [output, expected] = Normalize(input, case_sensitive_);
    if (absl::StrContains(output, expected)) {
        return BooleanScore(Name(), true, "contains expected value");
    }
    return BooleanScore(Name(), false, "does not contain expected value");
}

StartsWith::StartsWith(bool case_sensitive)
    : NamedMetric("starts_with"), case_sensitive_(case_sensitive) {}

ScoreResult StartsWith::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const auto [output, expected] = Normalize(input, case_sensitive_);
    if (absl::StartsWith(output, expected)) {
        return BooleanScore(Name(), true, "starts with expected value");
    }
    return BooleanScore(Name(), false, "does not start with expected value");
}

EndsWith::EndsWith(bool case_sensitive)
    : NamedMetric("ends_with"), case_sensitive_(case_sensitive) {}

ScoreResult EndsWith::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const auto [output, expected] = Normalize(input, case_sensitive_);
    if (absl::EndsWith(output, expected)) {
        return BooleanScore(Name(), true, "ends with expected value");
    }
    return BooleanScore(Name(), false, "does not end with expected value");
}

ContainsAny::ContainsAny(std::vector<std::string> values, bool case_sensitive)
    : NamedMetric("contains_any"),
      values_(std::move(values)),
      case_sensitive_(case_sensitive) {}

ScoreResult ContainsAny::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const std::string output = case_sensitive_ ? input.Output() : ToLower(input.Output());
    for (const auto& value : values_) {
        const std::string needle = case_sensitive_ ? value : ToLower(value);
        if (absl::StrContains(output, needle)) {
            return BooleanScore(Name(), true, absl::StrCat("contains: ", value));
        }
    }
    return BooleanScore(Name(), false, "does not contain any expected value");
}

ContainsAll::ContainsAll(std::vector<std::string> values, bool case_sensitive)
    : NamedMetric("contains_all"),
      values_(std::move(values)),
      case_sensitive_(case_sensitive) {}

ScoreResult ContainsAll::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const std::string output = case_sensitive_ ? input.Output() : ToLower(input.Output());

    std::vector<std::string> missing;
    for (const auto& value : values_) {
        const std::string needle = case_sensitive_ ? value : ToLower(value);
        if (!absl::StrContains(output, needle)) {
            missing.push_back(value);
        }
    }

    if (missing.empty()) {
        return ScoreResult::WithReason(Name(), 1.0, "contains all expected values");
    }

    const size_t found = values_.size() - missing.size();
    return ScoreResult::WithReason(
        Name(),
        static_cast<double>(found) / static_cast<double>(values_.size()),
        absl::StrCat("missing: ", absl::StrJoin(missing, ", ")));
}

NotEmpty::NotEmpty() : NamedMetric("not_empty") {}

ScoreResult NotEmpty::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (!TrimSpace(input.Output()).empty()) {
        return BooleanScore(Name(), true, "output is not empty");
    }
    return BooleanScore(Name(), false, "output is empty");
}

LengthBetween::LengthBetween(size_t min_length, size_t max_length)
    : NamedMetric("length_between"), min_length_(min_length), max_length_(max_length) {}

ScoreResult LengthBetween::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const size_t length = input.Output().size();
    if (length >= min_length_ && length <= max_length_) {
        return BooleanScore(Name(), true, "length within range");
    }
    return BooleanScore(Name(), false, absl::StrCat("length out of range: ", length));
}

WordCount::WordCount(size_t min_words, size_t max_words)
    : NamedMetric("word_count"), min_words_(min_words), max_words_(max_words) {}

ScoreResult WordCount::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const size_t count = Fields(input.Output()).size();
    if (count >= min_words_ && count <= max_words_) {
        return BooleanScore(Name(), true, "word count within range");
    }
    return BooleanScore(Name(), false, absl::StrCat("word count out of range: ", count));
}

NoOffensiveLanguage::NoOffensiveLanguage(std::vector<std::string> patterns)
    : NamedMetric("no_offensive_language"), patterns_(std::move(patterns)) {}

ScoreResult NoOffensiveLanguage::Score(const EvalContext& /*ctx*/,
                                       const MetricInput& input) const {
    const std::string lower = ToLower(input.Output());
    for (const auto& pattern : patterns_) {
        if (absl::StrContains(lower, ToLower(pattern))) {
            return BooleanScore(Name(), false, "contains offensive pattern");
        }
    }
    return BooleanScore(Name(), true, "no offensive language detected");
}

}  // namespace evalkit::eval::heuristic

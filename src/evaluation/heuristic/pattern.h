#pragma once

/// @file pattern.h
/// @brief Regular-expression checks on model output
///
/// Patterns use the ECMAScript grammar of std::regex and match anywhere in
/// the output unless they are anchored. User-supplied patterns are compiled
/// by the Create() factories, which reject invalid expressions up front so
/// that scoring itself never fails.

#include <cstddef>
#include <memory>
#include <regex>
#include <string>

#include <absl/status/statusor.h>

#include "evaluation/metric.h"

namespace evalkit::eval::heuristic {

/// @brief Compile a pattern, mapping std::regex_error to InvalidArgument
absl::StatusOr<std::regex> CompilePattern(const std::string& pattern);

/// @brief Base for metrics that test the output against one compiled regex
class PatternMetric : public NamedMetric {
public:
    const std::string& Pattern() const { return pattern_; }

protected:
    PatternMetric(std::string name, std::string pattern, std::regex regex);

    /// @brief True if the regex matches somewhere in text
    bool Matches(const std::string& text) const;

    const std::regex& Regex() const { return regex_; }

private:
    std::string pattern_;
    std::regex regex_;
};

/// @brief 1.0 when the output matches ("regex_match")
class RegexMatch : public PatternMetric {
public:
    static absl::StatusOr<std::shared_ptr<RegexMatch>> Create(const std::string& pattern);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    RegexMatch(std::string pattern, std::regex regex);
};

/// @brief 1.0 when the output does not match ("regex_not_match")
class RegexNotMatch : public PatternMetric {
public:
    static absl::StatusOr<std::shared_ptr<RegexNotMatch>> Create(const std::string& pattern);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    RegexNotMatch(std::string pattern, std::regex regex);
};

/// @brief 1.0 when the number of matches is within [min, max]
///        ("regex_find_all"); max == 0 means no upper bound
class RegexFindAll : public PatternMetric {
public:
    static absl::StatusOr<std::shared_ptr<RegexFindAll>> Create(
        const std::string& pattern, size_t min_matches, size_t max_matches = 0);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

    /// @brief Number of non-overlapping matches in text
    size_t CountMatches(const std::string& text) const;

private:
    RegexFindAll(std::string pattern, std::regex regex, size_t min_matches, size_t max_matches);

    size_t min_matches_;
    size_t max_matches_;
};

/// @brief Trimmed output is an e-mail address ("email_format")
class EmailFormat : public PatternMetric {
public:
    EmailFormat();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief Trimmed output is an http(s) URL ("url_format")
class UrlFormat : public PatternMetric {
public:
    UrlFormat();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief Trimmed output looks like a phone number of 7+ chars ("phone_format")
class PhoneFormat : public PatternMetric {
public:
    PhoneFormat();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief Trimmed output starts with an ISO-like date ("date_format")
class DateFormat : public PatternMetric {
public:
    DateFormat();

    /// @brief Date check with a caller-supplied pattern
    static absl::StatusOr<std::shared_ptr<DateFormat>> WithPattern(const std::string& pattern);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    DateFormat(std::string pattern, std::regex regex);
};

/// @brief Trimmed output is a canonical UUID ("uuid_format")
class UuidFormat : public PatternMetric {
public:
    UuidFormat();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

}  // namespace evalkit::eval::heuristic

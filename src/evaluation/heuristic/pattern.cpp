#include "evaluation/heuristic/pattern.h"

#include <iterator>

#include <absl/strings/str_cat.h>

#include "evaluation/heuristic/text.h"

namespace evalkit::eval::heuristic {

namespace {

constexpr char kEmailPattern[] = R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)";
constexpr char kUrlPattern[] = R"(^https?://[^\s/$.?#].[^\s]*$)";
constexpr char kPhonePattern[] = R"(^[+]?[(]?[0-9]{1,4}[)]?[-\s./0-9]*$)";
constexpr char kDatePattern[] = R"(^\d{4}[-/]\d{2}[-/]\d{2}(T\d{2}:\d{2}(:\d{2})?)?)";
constexpr char kUuidPattern[] =
    R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)";

constexpr size_t kMinPhoneLength = 7;

}  // namespace

absl::StatusOr<std::regex> CompilePattern(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid regex pattern '", pattern, "': ", e.what()));
    }
}

PatternMetric::PatternMetric(std::string name, std::string pattern, std::regex regex)
    : NamedMetric(std::move(name)), pattern_(std::move(pattern)), regex_(std::move(regex)) {}

bool PatternMetric::Matches(const std::string& text) const {
    return std::regex_search(text, regex_);
}

// ============================================================================
// User patterns
// ============================================================================

RegexMatch::RegexMatch(std::string pattern, std::regex regex)
    : PatternMetric("regex_match", std::move(pattern), std::move(regex)) {}

absl::StatusOr<std::shared_ptr<RegexMatch>> RegexMatch::Create(const std::string& pattern) {
    auto regex = CompilePattern(pattern);
    if (!regex.ok()) {
        return regex.status();
    }
    return std::shared_ptr<RegexMatch>(new RegexMatch(pattern, std::move(*regex)));
}

ScoreResult RegexMatch::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (Matches(input.Output())) {
        return BooleanScore(Name(), true, "matches pattern");
    }
    return BooleanScore(Name(), false, "does not match pattern");
}

RegexNotMatch::RegexNotMatch(std::string pattern, std::regex regex)
    : PatternMetric("regex_not_match", std::move(pattern), std::move(regex)) {}

absl::StatusOr<std::shared_ptr<RegexNotMatch>> RegexNotMatch::Create(const std::string& pattern) {
    auto regex = CompilePattern(pattern);
    if (!regex.ok()) {
        return regex.status();
    }
    return std::shared_ptr<RegexNotMatch>(new RegexNotMatch(pattern, std::move(*regex)));
}

ScoreResult RegexNotMatch::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (!Matches(input.Output())) {
        return BooleanScore(Name(), true, "does not match pattern");
    }
    return BooleanScore(Name(), false, "matches pattern (unexpected)");
}

RegexFindAll::RegexFindAll(std::string pattern, std::regex regex,
                           size_t min_matches, size_t max_matches)
    : PatternMetric("regex_find_all", std::move(pattern), std::move(regex)),
      min_matches_(min_matches),
      max_matches_(max_matches) {}

absl::StatusOr<std::shared_ptr<RegexFindAll>> RegexFindAll::Create(
    const std::string& pattern, size_t min_matches, size_t max_matches) {
    auto regex = CompilePattern(pattern);
    if (!regex.ok()) {
        return regex.status();
    }
    return std::shared_ptr<RegexFindAll>(
        new RegexFindAll(pattern, std::move(*regex), min_matches, max_matches));
}

size_t RegexFindAll::CountMatches(const std::string& text) const {
    return static_cast<size_t>(std::distance(
        std::sregex_iterator(text.begin(), text.end(), Regex()),
        std::sregex_iterator()));
}

ScoreResult RegexFindAll::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const size_t count = CountMatches(input.Output());
    if (count >= min_matches_ && (max_matches_ == 0 || count <= max_matches_)) {
        return BooleanScore(Name(), true, "match count within range");
    }
    return BooleanScore(Name(), false, absl::StrCat("match count out of range: ", count));
}

// ============================================================================
// Built-in formats
// ============================================================================

EmailFormat::EmailFormat()
    : PatternMetric("email_format", kEmailPattern, std::regex(kEmailPattern)) {}

ScoreResult EmailFormat::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (Matches(TrimSpace(input.Output()))) {
        return BooleanScore(Name(), true, "valid email format");
    }
    return BooleanScore(Name(), false, "invalid email format");
}

UrlFormat::UrlFormat()
    : PatternMetric("url_format", kUrlPattern, std::regex(kUrlPattern)) {}

ScoreResult UrlFormat::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (Matches(TrimSpace(input.Output()))) {
        return BooleanScore(Name(), true, "valid URL format");
    }
    return BooleanScore(Name(), false, "invalid URL format");
}

PhoneFormat::PhoneFormat()
    : PatternMetric("phone_format", kPhonePattern, std::regex(kPhonePattern)) {}

ScoreResult PhoneFormat::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const std::string output = TrimSpace(input.Output());
    if (output.size() >= kMinPhoneLength && Matches(output)) {
        return BooleanScore(Name(), true, "valid phone format");
    }
    return BooleanScore(Name(), false, "invalid phone format");
}

DateFormat::DateFormat()
    : PatternMetric("date_format", kDatePattern, std::regex(kDatePattern)) {}

DateFormat::DateFormat(std::string pattern, std::regex regex)
    : PatternMetric("date_format", std::move(pattern), std::move(regex)) {}

absl::StatusOr<std::shared_ptr<DateFormat>> DateFormat::WithPattern(const std::string& pattern) {
    auto regex = CompilePattern(pattern);
    if (!regex.ok()) {
        return regex.status();
    }
    return std::shared_ptr<DateFormat>(new DateFormat(pattern, std::move(*regex)));
}

ScoreResult DateFormat::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (Matches(TrimSpace(input.Output()))) {
        return BooleanScore(Name(), true, "valid date format");
    }
    return BooleanScore(Name(), false, "invalid date format");
}

UuidFormat::UuidFormat()
    : PatternMetric("uuid_format", kUuidPattern, std::regex(kUuidPattern)) {}

ScoreResult UuidFormat::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    if (Matches(TrimSpace(input.Output()))) {
        return BooleanScore(Name(), true, "valid UUID format");
    }
    return BooleanScore(Name(), false, "invalid UUID format");
}

}  // namespace evalkit::eval::heuristic

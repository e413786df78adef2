#pragma once

/// @file score.h
/// @brief Score records produced by metrics and their aggregate queries

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

namespace evalkit::eval {

/// @brief Outcome of one metric on one item
///
/// A score is successful iff `error` is OK. The value of a failed score is
/// unspecified and never enters an average.
struct ScoreResult {
    std::string name;
    double value = 0.0;                      ///< Typically 0.0 - 1.0
    std::optional<std::string> reason;
    std::optional<nlohmann::json> metadata;
    absl::Status error;

    bool IsSuccess() const { return error.ok(); }

    /// @brief "name: 0.8000", "name: 0.8000 (reason)" or "name: error - msg"
    std::string ToString() const;

    nlohmann::json ToJson() const;

    static ScoreResult Success(std::string name, double value);
    static ScoreResult WithReason(std::string name, double value, std::string reason);
    static ScoreResult Failure(std::string name, absl::Status error);
};

/// @brief 1.0 for true, 0.0 for false
ScoreResult BooleanScore(std::string name, bool value);
ScoreResult BooleanScore(std::string name, bool value, std::string reason);

/// @brief Ordered sequence of score records
class ScoreResults {
public:
    using const_iterator = std::vector<ScoreResult>::const_iterator;

    ScoreResults() = default;
    explicit ScoreResults(std::vector<ScoreResult> scores);

    void Add(ScoreResult score) { scores_.push_back(std::move(score)); }
    void Reserve(size_t n) { scores_.reserve(n); }

    size_t size() const { return scores_.size(); }
    bool empty() const { return scores_.empty(); }
    const ScoreResult& operator[](size_t i) const { return scores_[i]; }
    const_iterator begin() const { return scores_.begin(); }
    const_iterator end() const { return scores_.end(); }

    /// @brief First score with the given name, or nullptr
    const ScoreResult* ByName(const std::string& name) const;

    /// @brief Every score with the given name, in order
    ScoreResults AllByName(const std::string& name) const;

    ScoreResults Successful() const;
    ScoreResults Failed() const;

    /// @brief Mean value of successful scores; 0 if there are none
    double Average() const;

    /// @brief Mean value of successful scores with the given name; 0 if none
    double AverageByName(const std::string& name) const;

    nlohmann::json ToJson() const;

private:
    std::vector<ScoreResult> scores_;
};

}  // namespace evalkit::eval

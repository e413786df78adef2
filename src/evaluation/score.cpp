#include "evaluation/score.h"

#include <absl/strings/str_format.h>

namespace evalkit::eval {

namespace {

double MeanOfSuccessful(const ScoreResults& scores) {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& score : scores) {
        if (score.IsSuccess()) {
            sum += score.value;
            ++count;
        }
    }
    if (count == 0) {
        return 0.0;
    }
    return sum / static_cast<double>(count);
}

}  // namespace

std::string ScoreResult::ToString() const {
    if (!error.ok()) {
        return absl::StrFormat("%s: error - %s", name, error.message());
    }
    if (reason.has_value() && !reason->empty()) {
        return absl::StrFormat("%s: %.4f (%s)", name, value, *reason);
    }
    return absl::StrFormat("%s: %.4f", name, value);
}

nlohmann::json ScoreResult::ToJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["value"] = value;
    if (reason.has_value()) {
        j["reason"] = *reason;
    }
    if (metadata.has_value()) {
        j["metadata"] = *metadata;
    }
    if (!error.ok()) {
        j["error"] = error.ToString();
    }
    return j;
}

ScoreResult ScoreResult::Success(std::string name, double value) {
    ScoreResult result;
    result.name = std::move(name);
    result.value = value;
    return result;
}

ScoreResult ScoreResult::WithReason(std::string name, double value, std::string reason) {
    ScoreResult result;
    result.name = std::move(name);
    result.value = value;
    result.reason = std::move(reason);
    return result;
}

ScoreResult ScoreResult::Failure(std::string name, absl::Status error) {
    ScoreResult result;
    result.name = std::move(name);
    result.error = error.ok() ? absl::UnknownError("metric failed without a status")
                              : std::move(error);
    return result;
}

ScoreResult BooleanScore(std::string name, bool value) {
    return ScoreResult::Success(std::move(name), value ? 1.0 : 0.0);
}

ScoreResult BooleanScore(std::string name, bool value, std::string reason) {
    return ScoreResult::WithReason(std::move(name), value ? 1.0 : 0.0, std::move(reason));
}

ScoreResults::ScoreResults(std::vector<ScoreResult> scores)
    : scores_(std::move(scores)) {}

const ScoreResult* ScoreResults::ByName(const std::string& name) const {
    for (const auto& score : scores_) {
        if (score.name == name) {
            return &score;
        }
    }
    return nullptr;
}

ScoreResults ScoreResults::AllByName(const std::string& name) const {
    ScoreResults results;
    for (const auto& score : scores_) {
        if (score.name == name) {
            results.Add(score);
        }
    }
    return results;
}

ScoreResults ScoreResults::Successful() const {
    ScoreResults results;
    results.Reserve(scores_.size());
    for (const auto& score : scores_) {
        if (score.IsSuccess()) {
            results.Add(score);
        }
    }
    return results;
}

ScoreResults ScoreResults::Failed() const {
    ScoreResults results;
    for (const auto& score : scores_) {
        if (!score.IsSuccess()) {
            results.Add(score);
        }
    }
    return results;
}

double ScoreResults::Average() const {
    return MeanOfSuccessful(*this);
}

double ScoreResults::AverageByName(const std::string& name) const {
    return MeanOfSuccessful(AllByName(name));
}

nlohmann::json ScoreResults::ToJson() const {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& score : scores_) {
        array.push_back(score.ToJson());
    }
    return array;
}

}  // namespace evalkit::eval

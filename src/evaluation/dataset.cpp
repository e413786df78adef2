#include "evaluation/dataset.h"

#include <fstream>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"

namespace evalkit::eval {

namespace {

std::string StringField(const nlohmann::json& record, const std::string& key) {
    if (!record.is_object()) {
        return "";
    }
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

InputMapper DefaultInputMapper(std::string input_key,
                               std::string output_key,
                               std::string expected_key) {
    return [input_key = std::move(input_key),
            output_key = std::move(output_key),
            expected_key = std::move(expected_key)](const nlohmann::json& record) {
        return MetricInput(StringField(record, input_key), StringField(record, output_key))
            .WithExpected(StringField(record, expected_key))
            .WithMetadataObject(record);
    };
}

DatasetEvaluator::DatasetEvaluator(const Engine& engine, InputMapper mapper)
    : engine_(engine), mapper_(std::move(mapper)) {}

EvaluationResults DatasetEvaluator::Evaluate(
    const EvalContext& ctx,
    const std::vector<nlohmann::json>& records) const {
    std::vector<MetricInput> inputs;
    inputs.reserve(records.size());
    for (const auto& record : records) {
        inputs.push_back(mapper_(record));
    }
    return engine_.EvaluateMany(ctx, inputs);
}

absl::StatusOr<std::vector<nlohmann::json>> ParseRecords(const std::string& content) {
    std::vector<nlohmann::json> records;
    const absl::string_view trimmed = absl::StripAsciiWhitespace(content);
    if (trimmed.empty()) {
        return records;
    }

    if (trimmed.front() == '[') {
        nlohmann::json array;
        try {
            array = nlohmann::json::parse(trimmed.begin(), trimmed.end());
        } catch (const nlohmann::json::exception& e) {
            return MakeError(ErrorCode::kParseError,
                             absl::StrCat("Invalid JSON dataset: ", e.what()));
        }
        records.reserve(array.size());
        for (size_t i = 0; i < array.size(); ++i) {
            if (!array[i].is_object()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Dataset record ", i, " is not a JSON object"));
            }
            records.push_back(std::move(array[i]));
        }
        return records;
    }

    // JSON lines
    size_t line_number = 0;
    for (absl::string_view line : absl::StrSplit(content, '\n')) {
        ++line_number;
        line = absl::StripAsciiWhitespace(line);
        if (line.empty()) {
            continue;
        }
        nlohmann::json record;
        try {
            record = nlohmann::json::parse(line.begin(), line.end());
        } catch (const nlohmann::json::exception& e) {
            return MakeError(ErrorCode::kParseError,
                             absl::StrCat("Invalid JSON on line ", line_number, ": ", e.what()));
        }
        if (!record.is_object()) {
            return absl::InvalidArgumentError(
                absl::StrCat("Line ", line_number, " is not a JSON object"));
        }
        records.push_back(std::move(record));
    }
    return records;
}

absl::StatusOr<std::vector<nlohmann::json>> LoadRecords(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NotFoundError(absl::StrCat("Could not open dataset: ", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto records = ParseRecords(buffer.str());
    if (records.ok()) {
        EVALKIT_LOG_INFO("Loaded {} records from {}", records->size(), path.string());
    }
    return records;
}

}  // namespace evalkit::eval

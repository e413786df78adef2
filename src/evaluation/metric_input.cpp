#include "evaluation/metric_input.h"

namespace evalkit::eval {

MetricInput::MetricInput(std::string input, std::string output)
    : input_(std::move(input)), output_(std::move(output)) {}

const nlohmann::json& MetricInput::Metadata() const {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    return metadata_ ? *metadata_ : kEmpty;
}

MetricInput MetricInput::WithInput(std::string input) const {
    MetricInput copy = *this;
    copy.input_ = std::move(input);
    return copy;
}

MetricInput MetricInput::WithOutput(std::string output) const {
    MetricInput copy = *this;
    copy.output_ = std::move(output);
    return copy;
}

MetricInput MetricInput::WithExpected(std::string expected) const {
    MetricInput copy = *this;
    copy.expected_ = std::move(expected);
    return copy;
}

MetricInput MetricInput::WithContext(std::string context) const {
    MetricInput copy = *this;
    copy.context_ = std::move(context);
    return copy;
}

MetricInput MetricInput::WithMetadata(const std::string& key, nlohmann::json value) const {
    nlohmann::json updated = Metadata();
    updated[key] = std::move(value);

    MetricInput copy = *this;
    copy.metadata_ = std::make_shared<const nlohmann::json>(std::move(updated));
    return copy;
}

MetricInput MetricInput::WithMetadataObject(nlohmann::json metadata) const {
    MetricInput copy = *this;
    if (metadata.is_object()) {
        copy.metadata_ = std::make_shared<const nlohmann::json>(std::move(metadata));
    } else {
        copy.metadata_.reset();
    }
    return copy;
}

std::optional<nlohmann::json> MetricInput::Get(const std::string& key) const {
    const nlohmann::json& metadata = Metadata();
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    return *it;
}

std::string MetricInput::GetString(const std::string& key) const {
    const nlohmann::json& metadata = Metadata();
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::vector<std::string> MetricInput::GetStringList(const std::string& key) const {
    std::vector<std::string> result;
    const nlohmann::json& metadata = Metadata();
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_array()) {
        return result;
    }
    result.reserve(it->size());
    for (const auto& item : *it) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

}  // namespace evalkit::eval

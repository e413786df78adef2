#include "common/config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/logging.h"

namespace evalkit {

namespace {

Config g_global_config;

// YAML scalars carry no type tag once parsed; guess the narrowest JSON type.
nlohmann::json ScalarToJson(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        // Quoted scalar
        return text;
    }
    int64_t int_value = 0;
    if (absl::SimpleAtoi(text, &int_value)) {
        return int_value;
    }
    double double_value = 0.0;
    if (absl::SimpleAtod(text, &double_value)) {
        return double_value;
    }
    bool bool_value = false;
    if (absl::SimpleAtob(text, &bool_value)) {
        return bool_value;
    }
    return text;
}

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

}  // namespace

Config::Config() : root_(YAML::NodeType::Map) {}

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        YAML::Node loaded = YAML::LoadFile(path.string());
        if (loaded.IsMap()) {
            config.root_ = loaded;
        } else if (!loaded.IsNull()) {
            return absl::InvalidArgumentError(
                absl::StrCat("Configuration root must be a map: ", path.string()));
        }
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(absl::string_view yaml_content) {
    try {
        Config config;
        YAML::Node loaded = YAML::Load(std::string(yaml_content));
        if (loaded.IsMap()) {
            config.root_ = loaded;
        } else if (!loaded.IsNull()) {
            return absl::InvalidArgumentError("Configuration root must be a map");
        }
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(absl::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(prefix, suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("CONCURRENCY")) {
        int64_t concurrency = 0;
        if (absl::SimpleAtoi(*val, &concurrency)) {
            config.Set("evaluation.concurrency", concurrency);
        } else {
            EVALKIT_LOG_WARN("Ignoring non-numeric {}CONCURRENCY='{}'", std::string(prefix), *val);
        }
    }

    if (auto val = get_env("DATASET_PATH")) {
        config.Set("dataset.path", *val);
    }

    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNode(absl::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    // Node assignment copies values in yaml-cpp, so walk with reset()
    YAML::Node current;
    current.reset(root_);
    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next.IsDefined()) {
            return std::nullopt;
        }
        current.reset(next);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(absl::string_view key, absl::string_view default_value) const {
    auto node = GetNode(key);
    if (node && node->IsScalar()) {
        return node->Scalar();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(absl::string_view key, int64_t default_value) const {
    auto node = GetNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::BadConversion&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(absl::string_view key, double default_value) const {
    auto node = GetNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::BadConversion&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(absl::string_view key, bool default_value) const {
    auto node = GetNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::BadConversion&) {
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(absl::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            }
        }
    }
    return result;
}

bool Config::HasKey(absl::string_view key) const {
    return GetNode(key).has_value();
}

void Config::Set(absl::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path,
    absl::string_view env_prefix
) {
    g_global_config = Config();

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        g_global_config.Merge(*file_config);
    }

    // Environment variables take precedence over the file
    Config env_config = Config::LoadFromEnvironment(env_prefix);
    g_global_config.Merge(env_config);

    return absl::OkStatus();
}

}  // namespace evalkit

/// @file config.cpp
/// @brief YAML and environment settings

#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "error.h"
#include "logging.h"

namespace clintab {

namespace {

enum class EnvKind { kText, kNumber, kFlag };

struct EnvSetting {
    const char* suffix;
    const char* key;
    EnvKind kind;
};

constexpr EnvSetting kEnvSettings[] = {
    {"LOG_LEVEL", "logging.level", EnvKind::kText},
    {"MISSING_TEXT", "table.missing_text", EnvKind::kText},
    {"FOOTNOTE_MARKS", "table.footnote_marks", EnvKind::kText},
    {"THOUSANDS_SEPARATOR", "table.thousands_separator", EnvKind::kFlag},
    {"CONFIDENCE_LEVEL", "stats.confidence_level", EnvKind::kNumber},
};

nlohmann::json ScalarToJson(const std::string& scalar) {
    int64_t integer = 0;
    double number = 0.0;
    if (absl::SimpleAtoi(scalar, &integer)) {
        return integer;
    }
    if (absl::SimpleAtod(scalar, &number)) {
        return number;
    }
    if (scalar == "true" || scalar == "false") {
        return scalar == "true";
    }
    return scalar;
}

nlohmann::json NodeToJson(const YAML::Node& node) {
    if (node.IsMap()) {
        nlohmann::json object = nlohmann::json::object();
        for (const auto& entry : node) {
            object[entry.first.as<std::string>()] = NodeToJson(entry.second);
        }
        return object;
    }
    if (node.IsSequence()) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : node) {
            array.push_back(NodeToJson(item));
        }
        return array;
    }
    if (node.IsScalar()) {
        return ScalarToJson(node.Scalar());
    }
    return nullptr;
}

void MergeNodes(YAML::Node base, const YAML::Node& overlay) {
    if (!overlay.IsMap()) {
        return;
    }
    for (const auto& entry : overlay) {
        const std::string key = entry.first.as<std::string>();
        if (base[key] && base[key].IsMap() && entry.second.IsMap()) {
            MergeNodes(base[key], entry.second);
        } else {
            base[key] = YAML::Clone(entry.second);
        }
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("No configuration file at ", path.string()));
    }

    Config config;
    try {
        config.root_ = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Malformed YAML in ", path.string(), ": ", e.what()));
    }
    CLINTAB_LOG_DEBUG("Read settings from {}", path.string());
    return config;
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    Config config;
    try {
        config.root_ = YAML::Load(std::string(yaml_content));
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Malformed YAML: ", e.what()));
    }
    return config;
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& setting : kEnvSettings) {
        const std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), setting.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        const std::string text(raw);

        switch (setting.kind) {
            case EnvKind::kText:
                config.Set(setting.key, text);
                break;
            case EnvKind::kNumber: {
                double number = 0.0;
                if (!absl::SimpleAtod(text, &number)) {
                    return MakeError(ErrorCode::kConfigurationError,
                                     absl::StrCat(name, " is not a number: ", text));
                }
                config.Set(setting.key, number);
                break;
            }
            case EnvKind::kFlag: {
                bool flag = false;
                if (!absl::SimpleAtob(text, &flag)) {
                    return MakeError(ErrorCode::kConfigurationError,
                                     absl::StrCat(name, " is not a boolean: ", text));
                }
                config.Set(setting.key, flag);
                break;
            }
        }
    }
    return config;
}

absl::StatusOr<Config> Config::Load(const std::optional<std::filesystem::path>& path,
                                    std::string_view env_prefix) {
    Config config;
    if (path.has_value()) {
        CLINTAB_ASSIGN_OR_RETURN(Config from_file, LoadFromFile(*path));
        config.Merge(from_file);
    }
    CLINTAB_ASSIGN_OR_RETURN(Config from_env, LoadFromEnvironment(env_prefix));
    config.Merge(from_env);
    return config;
}

void Config::Merge(const Config& other) {
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    MergeNodes(root_, other.root_);
}

std::optional<YAML::Node> Config::Lookup(std::string_view key) const {
    // Walk a clone: operator[] on a missing key would otherwise insert into root_
    YAML::Node node = YAML::Clone(root_);
    for (absl::string_view part : absl::StrSplit(absl::string_view(key.data(), key.size()), '.')) {
        if (!node.IsMap()) {
            return std::nullopt;
        }
        YAML::Node child = node[std::string(part)];
        node.reset(child);
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return node;
}

template <typename T>
T Config::GetScalar(std::string_view key, T default_value, std::string_view type_name) const {
    auto node = Lookup(key);
    if (!node.has_value() || !node->IsScalar()) {
        return default_value;
    }
    try {
        return node->as<T>();
    } catch (const YAML::BadConversion&) {
        CLINTAB_LOG_WARN("Setting {} = \"{}\" is not {}; using default", key,
                         node->Scalar(), type_name);
    }
    return default_value;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    return GetScalar<std::string>(key, std::string(default_value), "text");
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    return GetScalar<int64_t>(key, default_value, "an integer");
}

double Config::GetDouble(std::string_view key, double default_value) const {
    return GetScalar<double>(key, default_value, "a number");
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    return GetScalar<bool>(key, default_value, "a boolean");
}

bool Config::HasKey(std::string_view key) const {
    return Lookup(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    const std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // Handles alias root_; reset() rebinds a handle without writing through it
    YAML::Node parent = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!parent[parts[i]].IsMap()) {
            parent[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = parent[parts[i]];
        parent.reset(child);
    }

    YAML::Node leaf = std::visit(
        [](const auto& v) -> YAML::Node {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                YAML::Node sequence(YAML::NodeType::Sequence);
                for (const auto& item : v) {
                    sequence.push_back(item);
                }
                return sequence;
            } else {
                return YAML::Node(v);
            }
        },
        value);
    parent[parts.back()] = leaf;
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

}  // namespace clintab

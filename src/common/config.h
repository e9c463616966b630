#pragma once

/// @file config.h
/// @brief Report settings read from YAML and the environment

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace clintab {

/// @brief Scalar or list accepted by Config::Set
using ConfigValue = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

/// @brief Nested YAML settings addressed with dotted keys
///
/// Keys look like "table.missing_text" or "stats.confidence_level". Typed
/// getters return the default when the key is absent or holds another type.
class Config {
public:
    Config() = default;

    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Settings taken from <prefix>LOG_LEVEL, <prefix>MISSING_TEXT,
    /// <prefix>FOOTNOTE_MARKS, <prefix>CONFIDENCE_LEVEL and
    /// <prefix>THOUSANDS_SEPARATOR
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "CLINTAB_");

    /// @brief Optional file first, environment on top
    static absl::StatusOr<Config> Load(const std::optional<std::filesystem::path>& path,
                                       std::string_view env_prefix = "CLINTAB_");

    /// @brief Deep merge; values from other win
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    bool HasKey(std::string_view key) const;

    /// @brief Store a value, creating intermediate maps as needed
    void Set(std::string_view key, ConfigValue value);

    nlohmann::json ToJson() const;

private:
    std::optional<YAML::Node> Lookup(std::string_view key) const;

    template <typename T>
    T GetScalar(std::string_view key, T default_value, std::string_view type_name) const;

    YAML::Node root_;
};

}  // namespace clintab

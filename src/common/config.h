#pragma once

/// @file config.h
/// @brief FlowGuard configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <yaml-cpp/yaml.h>

namespace flowguard {

/// @brief Scalar configuration value accepted by Config::Set
using ConfigValue = std::variant<bool, int64_t, double, std::string>;

/// @brief Hierarchical YAML configuration with dot-notation access
///
/// Values are layered: a YAML file provides the base and `FLOWGUARD_*`
/// environment variables override it.
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "FLOWGUARD_")
    /// @return Error if a recognised variable holds an unparsable value
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "FLOWGUARD_");

    /// @brief Load an optional file and overlay the environment on top of it
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& config_path,
        std::string_view env_prefix = "FLOWGUARD_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    /// @brief Typed lookup that distinguishes "missing" from "malformed"
    /// @return nullopt when the key is absent, an error when the value does
    ///         not convert to T
    template <typename T>
    absl::StatusOr<std::optional<T>> Lookup(std::string_view key) const;

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

template <typename T>
absl::StatusOr<std::optional<T>> Config::Lookup(std::string_view key) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return std::optional<T>();
    }
    if (!node->IsScalar()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Configuration key '", absl::string_view(key.data(), key.size()), "' is not a scalar"));
    }
    try {
        return std::optional<T>(node->template as<T>());
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid value for configuration key '", absl::string_view(key.data(), key.size()), "': ", e.what()));
    }
}

}  // namespace flowguard

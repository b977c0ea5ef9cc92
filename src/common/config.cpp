#include "config.h"

#include <cstdlib>
#include <functional>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace flowguard {

namespace {

enum class EnvKind { kString, kBool, kDouble };

struct EnvBinding {
    const char* suffix;
    const char* key;
    EnvKind kind;
};

// Environment variables recognised by LoadFromEnvironment, relative to the prefix
const EnvBinding kEnvBindings[] = {
    {"SENSITIVITY", "guardian.injection.sensitivity", EnvKind::kString},
    {"HIGH_ENTROPY", "guardian.sanitizer.enable_high_entropy", EnvKind::kBool},
    {"ENTROPY_THRESHOLD", "guardian.sanitizer.entropy_threshold", EnvKind::kDouble},
    {"LOG_LEVEL", "logging.level", EnvKind::kString},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        const std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), binding.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }

        switch (binding.kind) {
            case EnvKind::kString:
                config.Set(binding.key, std::string(raw));
                break;
            case EnvKind::kBool: {
                bool value = false;
                if (!absl::SimpleAtob(raw, &value)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " is not a boolean: ", raw));
                }
                config.Set(binding.key, value);
                break;
            }
            case EnvKind::kDouble: {
                double value = 0.0;
                if (!absl::SimpleAtod(raw, &value)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " is not a number: ", raw));
                }
                config.Set(binding.key, value);
                break;
            }
        }
        FLOWGUARD_LOG_DEBUG("Configuration key {} overridden by {}", binding.key, name);
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment has the highest priority
    auto env_config = LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    return config;
}

void Config::Merge(const Config& other) {
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

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // reset() rebinds without writing through to root_
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& view = current;
        YAML::Node child = view[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto value = Lookup<std::string>(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto value = Lookup<int64_t>(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = Lookup<double>(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto value = Lookup<bool>(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return default_value;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    const std::string& leaf = parts.back();
    std::visit([&current, &leaf](auto&& val) { current[leaf] = val; }, value);
}

}  // namespace flowguard

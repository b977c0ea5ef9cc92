/// @file main.cpp
/// @brief FlowGuard command-line entry point
///
/// Exit codes: 0 clean, 2 security flags raised, 3 error.

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "guardian/guardian_config.h"
#include "guardian/risk_aggregator.h"

namespace {

const char kVersion[] = "1.0.0";

const int kExitClean = 0;
const int kExitFlagged = 2;
const int kExitError = 3;

/// Options shared by every subcommand
struct CliOptions {
    std::string config_path;
    std::string log_level;
    std::string sensitivity;
    bool no_entropy = false;
    size_t max_bytes = 0;  ///< 0 = unlimited
    bool json = false;
    bool strict = false;
    std::vector<std::string> inputs;
};

/// Read a file, or stdin for "-" or an empty path
absl::StatusOr<std::string> ReadInput(const std::string& path, size_t max_bytes) {
    std::string content;
    if (path.empty() || path == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        if (std::cin.bad()) {
            return flowguard::MakeError(flowguard::ErrorCode::kIoError, "Failed to read stdin");
        }
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return flowguard::MakeError(flowguard::ErrorCode::kIoError,
                                        absl::StrCat("Cannot open ", path));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        content = buffer.str();
    }

    if (max_bytes > 0 && content.size() > max_bytes) {
        FLOWGUARD_LOG_WARN("Input {} truncated from {} to {} bytes",
                           path.empty() ? "<stdin>" : path, content.size(), max_bytes);
        content.resize(max_bytes);
    }
    return content;
}

/// Layer YAML file, environment and command-line overrides
absl::StatusOr<flowguard::guardian::GuardianConfig> BuildGuardianConfig(
    const CliOptions& options) {
    std::optional<std::filesystem::path> path;
    if (!options.config_path.empty()) {
        path = options.config_path;
    }
    FLOWGUARD_ASSIGN_OR_RETURN(flowguard::Config config, flowguard::Config::LoadLayered(path));

    // Config-file log level applies unless --log-level was given
    if (options.log_level.empty() && config.HasKey("logging.level")) {
        FLOWGUARD_ASSIGN_OR_RETURN(
            flowguard::LogLevel level,
            flowguard::ParseLogLevel(config.GetString("logging.level", "info")));
        flowguard::SetLogLevel(level);
    }

    FLOWGUARD_ASSIGN_OR_RETURN(auto guardian_config,
                               flowguard::guardian::GuardianConfig::FromConfig(config));

    if (!options.sensitivity.empty()) {
        FLOWGUARD_ASSIGN_OR_RETURN(guardian_config.injection.sensitivity,
                                   flowguard::guardian::ParseSensitivity(options.sensitivity));
    }
    if (options.no_entropy) {
        guardian_config.sanitizer.enable_high_entropy = false;
    }
    return guardian_config;
}

absl::StatusOr<std::vector<std::string>> ScanInput(
    const std::string& input, size_t max_bytes,
    const flowguard::guardian::RiskAggregator& aggregator) {
    FLOWGUARD_ASSIGN_OR_RETURN(std::string text, ReadInput(input, max_bytes));
    return aggregator.ApplySecurityScan(text);
}

absl::StatusOr<int> RunScan(const CliOptions& options,
                            const flowguard::guardian::RiskAggregator& aggregator) {
    std::vector<std::string> inputs = options.inputs;
    if (inputs.empty()) {
        inputs.emplace_back("-");
    }

    std::vector<std::string> flags;
    for (const auto& input : inputs) {
        auto file_flags = ScanInput(input, options.max_bytes, aggregator);
        if (!file_flags.ok()) {
            return flowguard::Annotate(file_flags.status(), input);
        }
        for (auto& flag : *file_flags) {
            flags.push_back(inputs.size() > 1 ? absl::StrCat(input, ": ", flag) : std::move(flag));
        }
    }

    if (options.json) {
        nlohmann::json output;
        output["flags"] = flags;
        std::cout << output.dump(2) << std::endl;
    } else {
        for (const auto& flag : flags) {
            std::cout << flag << "\n";
        }
    }

    if (flags.empty()) {
        return kExitClean;
    }
    if (options.strict) {
        std::cout << "❌ Strict mode: blocking on " << flags.size() << " security flag(s)"
                  << std::endl;
    }
    return kExitFlagged;
}

absl::StatusOr<int> RunSanitize(const CliOptions& options,
                                const flowguard::guardian::RiskAggregator& aggregator) {
    const std::string input = options.inputs.empty() ? "-" : options.inputs.front();
    FLOWGUARD_ASSIGN_OR_RETURN(std::string text, ReadInput(input, options.max_bytes));
    FLOWGUARD_ASSIGN_OR_RETURN(auto result, aggregator.GetSanitizer().Sanitize(text));

    if (options.json) {
        std::cout << result.ToJson().dump(2) << std::endl;
    } else {
        std::cout << result.sanitized_text;
    }
    return kExitClean;
}

absl::StatusOr<int> RunInject(const CliOptions& options,
                              const flowguard::guardian::RiskAggregator& aggregator) {
    const std::string input = options.inputs.empty() ? "-" : options.inputs.front();
    FLOWGUARD_ASSIGN_OR_RETURN(std::string text, ReadInput(input, options.max_bytes));
    FLOWGUARD_ASSIGN_OR_RETURN(auto result, aggregator.GetInjectionFilter().Scan(text));

    std::cout << result.ToJson().dump(2) << std::endl;
    return result.is_safe ? kExitClean : kExitFlagged;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"FlowGuard - secret, PII and prompt-injection guard for developer text"};

    CliOptions options;
    bool version_flag = false;

    app.add_option("-c,--config", options.config_path, "Path to YAML configuration file");
    app.add_option("--log-level", options.log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)");
    app.add_option("--sensitivity", options.sensitivity,
                   "Injection filter sensitivity (low, medium, high)");
    app.add_flag("--no-entropy", options.no_entropy, "Disable the high-entropy secret pass");
    app.add_option("--max-bytes", options.max_bytes, "Truncate each input to this many bytes");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    auto* scan = app.add_subcommand("scan", "Print security flags for files or stdin");
    scan->add_option("files", options.inputs, "Input files ('-' for stdin)");
    scan->add_flag("--json", options.json, "Print flags as JSON");
    scan->add_flag("--strict", options.strict, "Print a blocking notice when flags are raised");

    auto* sanitize = app.add_subcommand("sanitize", "Print input with secrets and PII redacted");
    sanitize->add_option("file", options.inputs, "Input file ('-' for stdin)")->expected(0, 1);
    sanitize->add_flag("--json", options.json, "Print the full sanitization result as JSON");

    auto* inject = app.add_subcommand("inject", "Print the prompt-injection scan as JSON");
    inject->add_option("file", options.inputs, "Input file ('-' for stdin)")->expected(0, 1);

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "FlowGuard v" << kVersion << std::endl;
        return kExitClean;
    }
    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        return kExitError;
    }

    // Initialize logging
    flowguard::LogConfig log_config;
    if (!options.log_level.empty()) {
        auto level = flowguard::ParseLogLevel(options.log_level);
        if (!level.ok()) {
            std::cerr << level.status().message() << std::endl;
            return kExitError;
        }
        log_config.level = *level;
    }
    flowguard::InitLogging(log_config);

    auto guardian_config = BuildGuardianConfig(options);
    if (!guardian_config.ok()) {
        FLOWGUARD_LOG_ERROR("Failed to load config: {}", guardian_config.status().message());
        return kExitError;
    }

    auto aggregator = flowguard::guardian::RiskAggregator::Create(*guardian_config);
    if (!aggregator.ok()) {
        FLOWGUARD_LOG_ERROR("Failed to initialize guardian: {}", aggregator.status().message());
        return kExitError;
    }

    absl::StatusOr<int> exit_code = kExitError;
    if (scan->parsed()) {
        exit_code = RunScan(options, **aggregator);
    } else if (sanitize->parsed()) {
        exit_code = RunSanitize(options, **aggregator);
    } else if (inject->parsed()) {
        exit_code = RunInject(options, **aggregator);
    }

    if (!exit_code.ok()) {
        FLOWGUARD_LOG_ERROR("{}", exit_code.status().message());
        flowguard::ShutdownLogging();
        return kExitError;
    }

    flowguard::ShutdownLogging();
    return *exit_code;
}

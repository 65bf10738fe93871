#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace gamesmith::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("interpreter") && sandbox["interpreter"].is_string()) {
            config.sandbox.interpreter = sandbox["interpreter"].get<std::string>();
        }
        if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number_integer()) {
            config.sandbox.timeout_s = sandbox["timeoutS"].get<int>();
        }
        if (sandbox.contains("scratchDir") && sandbox["scratchDir"].is_string()) {
            config.sandbox.scratch_dir = sandbox["scratchDir"].get<std::string>();
        }
        if (sandbox.contains("extraEnv") && sandbox["extraEnv"].is_object()) {
            config.sandbox.extra_env.clear();
            for (const auto& item : sandbox["extraEnv"].items()) {
                if (item.value().is_string()) {
                    config.sandbox.extra_env[item.key()] = item.value().get<std::string>();
                }
            }
        }
    }

    if (data.contains("storage") && data["storage"].is_object()) {
        const auto& storage = data["storage"];
        if (storage.contains("outputDir") && storage["outputDir"].is_string()) {
            config.storage.output_dir = storage["outputDir"].get<std::string>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyFile(Config& config, const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::Log(utils::LogLevel::kWarn, "config", "cannot open " + path.string());
        return;
    }
    try {
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "config",
                   "ignoring " + path.string() + ": " + ex.what());
    }
}

void ApplyEnvironment(Config& config) {
    const auto interpreter = GetEnvFallback(
        "GAMESMITH_SANDBOX__INTERPRETER",
        "GAMESMITH_INTERPRETER");
    if (!interpreter.empty()) {
        config.sandbox.interpreter = interpreter;
    }

    const auto timeout = GetEnvFallback(
        "GAMESMITH_SANDBOX__TIMEOUT_S",
        "GAMESMITH_TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseInt(timeout, config.sandbox.timeout_s);
    }

    const auto scratch_dir = GetEnvFallback(
        "GAMESMITH_SANDBOX__SCRATCH_DIR",
        "GAMESMITH_SCRATCH_DIR");
    if (!scratch_dir.empty()) {
        config.sandbox.scratch_dir = scratch_dir;
    }

    const auto output_dir = GetEnvFallback(
        "GAMESMITH_STORAGE__OUTPUT_DIR",
        "GAMESMITH_OUTPUT_DIR");
    if (!output_dir.empty()) {
        config.storage.output_dir = output_dir;
    }

    const auto log_level = GetEnvFallback(
        "GAMESMITH_LOGGING__LEVEL",
        "GAMESMITH_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void Finalize(Config& config) {
    if (config.sandbox.timeout_s <= 0) {
        utils::Log(utils::LogLevel::kWarn, "config",
                   "non-positive timeout " + std::to_string(config.sandbox.timeout_s) + ", using 30s");
        config.sandbox.timeout_s = SandboxConfig{}.timeout_s;
    }
    config.sandbox.scratch_dir = ExpandUserPath(config.sandbox.scratch_dir);
    config.storage.output_dir = ExpandUserPath(config.storage.output_dir);
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".gamesmith" / "config.json";
}

std::string ExpandUserPath(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    ApplyFile(config, path);
    ApplyEnvironment(config);
    Finalize(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromFile(DefaultConfigPath());
}

}  // namespace gamesmith::config

#pragma once

#include <map>
#include <string>

namespace gamesmith::config {

struct SandboxConfig {
    std::string interpreter = "python3";
    int timeout_s = 30;
    std::string scratch_dir;
    std::map<std::string, std::string> extra_env;
};

struct StorageConfig {
    std::string output_dir = "~/.gamesmith/games";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    StorageConfig storage;
    LoggingConfig logging;
};

}  // namespace gamesmith::config

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "game/code_extractor.hpp"
#include "game/game_designer.hpp"
#include "game/game_pipeline.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace {

struct CommandLine {
    std::string command;
    std::string input;
    std::optional<std::string> config_path;
    std::optional<int> timeout_s;
    std::optional<std::string> output_dir;
    bool all_blocks = false;
};

void PrintUsage() {
    std::cout << "Usage: gamesmith [--config FILE] extract [--all] <response-file|->\n"
              << "       gamesmith [--config FILE] validate <response-file|->\n"
              << "       gamesmith [--config FILE] run [--timeout N] [--output DIR] <response-file|->"
              << std::endl;
}

std::optional<CommandLine> ParseArgs(int argc, char** argv) {
    CommandLine line{};
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            line.config_path = argv[++i];
        } else if (arg == "--timeout" && has_value) {
            try {
                line.timeout_s = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                line.timeout_s = 0;
            }
            if (*line.timeout_s <= 0) {
                std::cout << "Invalid --timeout value." << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--output" && has_value) {
            line.output_dir = argv[++i];
        } else if (arg == "--all") {
            line.all_blocks = true;
        } else if (arg.size() > 1 && arg.rfind("--", 0) == 0) {
            std::cout << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        return std::nullopt;
    }
    line.command = positional[0];
    line.input = positional[1];
    return line;
}

std::string ReadInput(const std::string& path) {
    std::ostringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("cannot read " + path);
    }
    buffer << input.rdbuf();
    return buffer.str();
}

int RunExtract(const CommandLine& line) {
    const auto text = ReadInput(line.input);
    if (!line.all_blocks) {
        std::cout << gamesmith::game::CodeExtractor::Extract(text) << std::endl;
        return 0;
    }
    const auto blocks = gamesmith::game::CodeExtractor::FindBlocks(text);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        std::cout << "--- block " << (i + 1) << " (" << blocks[i].size() << " chars)\n"
                  << blocks[i] << std::endl;
    }
    return blocks.empty() ? 1 : 0;
}

int RunValidate(const CommandLine& line) {
    const auto design = gamesmith::game::InspectResponse(ReadInput(line.input));
    std::cout << design.error << std::endl;
    return design.valid ? 0 : 1;
}

int RunGame(const CommandLine& line, const gamesmith::config::Config& config) {
    gamesmith::game::PipelineOptions options{};
    options.output_dir = gamesmith::config::ExpandUserPath(
        line.output_dir.value_or(config.storage.output_dir));
    options.timeout = std::chrono::seconds(line.timeout_s.value_or(config.sandbox.timeout_s));
    options.exec.interpreter = config.sandbox.interpreter;
    options.exec.scratch_root = config.sandbox.scratch_dir;
    options.exec.extra_env = config.sandbox.extra_env;

    const auto design = gamesmith::game::InspectResponse(ReadInput(line.input));
    const gamesmith::game::GamePipeline pipeline(std::move(options));
    const auto result = pipeline.Play(design);
    std::cout << gamesmith::game::GameRunResultToJson(result).dump(
                     2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    const auto line = ParseArgs(argc, argv);
    if (!line) {
        PrintUsage();
        return 1;
    }

    try {
        const auto config = line->config_path
            ? gamesmith::config::LoadConfigFromFile(*line->config_path)
            : gamesmith::config::LoadConfig();
        gamesmith::utils::LogConfig log_config{};
        log_config.min_level = gamesmith::utils::ParseLogLevel(config.logging.level);
        gamesmith::utils::ConfigureLogging(log_config);

        if (line->command == "extract") {
            return RunExtract(*line);
        }
        if (line->command == "validate") {
            return RunValidate(*line);
        }
        if (line->command == "run") {
            return RunGame(*line, config);
        }
    } catch (const std::exception& ex) {
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 1;
}

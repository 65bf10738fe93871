#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "game/artifact_store.hpp"
#include "game/game_designer.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace gamesmith::game {

struct PipelineOptions {
    std::filesystem::path output_dir;
    std::chrono::seconds timeout{30};
    sandbox::ExecOptions exec;
};

struct GameRunResult {
    bool success = false;
    std::string code;
    std::string error;
    DesignResult design;
    std::optional<sandbox::ExecutionRecord> execution;
    std::optional<SavedArtifact> artifact;
};

// Runs an accepted design and persists it. Declined designs are reported
// back without being executed or saved.
class GamePipeline {
public:
    explicit GamePipeline(PipelineOptions options);

    GameRunResult Play(const DesignResult& design) const;

private:
    PipelineOptions options_;
    sandbox::SandboxExecutor executor_;
};

nlohmann::json GameRunResultToJson(const GameRunResult& result);

}  // namespace gamesmith::game

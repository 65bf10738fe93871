#include "game/game_pipeline.hpp"

#include "utils/logging.hpp"

namespace gamesmith::game {

GamePipeline::GamePipeline(PipelineOptions options)
    : options_(std::move(options))
    , executor_(options_.exec) {}

GameRunResult GamePipeline::Play(const DesignResult& design) const {
    GameRunResult result{};
    result.design = design;
    result.code = design.code;
    if (!design.valid) {
        result.error = "Code generation failed: " + design.error;
        return result;
    }

    utils::Log(utils::LogLevel::kInfo, "pipeline",
               "executing candidate, timeout " + std::to_string(options_.timeout.count()) + "s");
    auto record = executor_.Run(design.code, options_.timeout);
    result.success = record.success;
    result.artifact = ArtifactStore::Save(design.code, record, options_.output_dir);
    result.execution = std::move(record);
    return result;
}

nlohmann::json GameRunResultToJson(const GameRunResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["success"] = result.success;
    json["code"] = result.code;
    json["response_time"] = result.design.response_time.count();
    if (!result.error.empty()) {
        json["error"] = result.error;
        json["raw_response"] = result.design.raw_response;
    }
    if (result.execution) {
        json["execution"] = ExecutionRecordToJson(*result.execution);
    }
    if (result.artifact) {
        json["game_directory"] = result.artifact->directory_path.string();
    }
    return json;
}

}  // namespace gamesmith::game

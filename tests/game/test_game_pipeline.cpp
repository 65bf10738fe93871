#include <gtest/gtest.h>
#include "game/game_pipeline.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

using gamesmith::game::GamePipeline;
using gamesmith::game::GameRunResultToJson;
using gamesmith::game::InspectResponse;
using gamesmith::game::PipelineOptions;
using gamesmith::testing::IsEmptyDirectory;
using gamesmith::testing::ReadFile;
using gamesmith::testing::TempDir;

namespace {

class GamePipelineTest : public ::testing::Test {
protected:
    GamePipeline MakePipeline(std::chrono::seconds timeout = std::chrono::seconds(10)) const {
        PipelineOptions options{};
        options.output_dir = output_.Path() / "games";
        options.timeout = timeout;
        options.exec.scratch_root = scratch_.Path().string();
        return GamePipeline(options);
    }

    TempDir output_;
    TempDir scratch_;
};

}  // namespace

TEST_F(GamePipelineTest, ValidDesign_IsExecutedAndSaved) {
    const auto design = InspectResponse(
        "```python\n"
        "class Game:\n"
        "    def play(self):\n"
        "        for generation in range(1, 4):\n"
        "            print(f'Generation {generation}:')\n"
        "\n"
        "Game().play()\n"
        "```");
    ASSERT_TRUE(design.valid) << design.error;

    const auto result = MakePipeline().Play(design);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.error.empty());
    ASSERT_TRUE(result.execution.has_value());
    EXPECT_NE(result.execution->output.find("Generation 3:"), std::string::npos);
    ASSERT_TRUE(result.artifact.has_value());
    EXPECT_EQ(ReadFile(result.artifact->source_file_path), design.code);

    const auto saved = nlohmann::json::parse(ReadFile(result.artifact->record_file_path));
    EXPECT_EQ(saved.at("stdout").get<std::string>(), result.execution->output);

    const auto summary = GameRunResultToJson(result);
    EXPECT_EQ(summary.at("game_directory").get<std::string>(),
              result.artifact->directory_path.string());
    EXPECT_FALSE(summary.contains("error"));
    EXPECT_TRUE(IsEmptyDirectory(scratch_.Path()));
}

TEST_F(GamePipelineTest, InvalidDesign_IsNeitherExecutedNorSaved) {
    const auto design = InspectResponse("```python\nprint('no game here')\n```");
    ASSERT_FALSE(design.valid);

    const auto result = MakePipeline().Play(design);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Code generation failed: no 'Game' type found");
    EXPECT_FALSE(result.execution.has_value());
    EXPECT_FALSE(result.artifact.has_value());
    EXPECT_FALSE(std::filesystem::exists(output_.Path() / "games"));

    const auto summary = GameRunResultToJson(result);
    EXPECT_EQ(summary.at("success").get<bool>(), false);
    EXPECT_TRUE(summary.contains("raw_response"));
}

TEST_F(GamePipelineTest, FailingGame_IsStillSaved) {
    const auto design = InspectResponse(
        "class Game:\n    def play(self):\n        raise SystemExit(3)\n\nGame().play()\n");
    ASSERT_TRUE(design.valid) << design.error;

    const auto result = MakePipeline().Play(design);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.execution.has_value());
    EXPECT_EQ(result.execution->exit_code, 3);
    ASSERT_TRUE(result.artifact.has_value());
    const auto saved = nlohmann::json::parse(ReadFile(result.artifact->record_file_path));
    EXPECT_EQ(saved.at("returncode").get<int>(), 3);
    EXPECT_EQ(saved.at("success").get<bool>(), false);
}

TEST_F(GamePipelineTest, RunawayGame_TimesOutAndIsSaved) {
    const auto design = InspectResponse(
        "class Game:\n    def play(self):\n        while True:\n            pass\n\nGame().play()\n");
    const auto result = MakePipeline(std::chrono::seconds(1)).Play(design);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.execution.has_value());
    EXPECT_EQ(result.execution->exit_code, -1);
    EXPECT_NE(result.execution->error.find("timeout"), std::string::npos);
    ASSERT_TRUE(result.artifact.has_value());
    EXPECT_EQ(result.artifact->directory_path.filename().string().substr(0, 9), "game_001_");
}

#include "game/artifact_store.hpp"

#include <cstdio>
#include <fstream>
#include <regex>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gamesmith::game {
namespace {

constexpr const char* kSourceFile = "game.py";
constexpr const char* kRecordFile = "execution_results.json";

void WriteText(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("failed to open for write: " + path.string());
    }
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!output) {
        throw std::runtime_error("short write: " + path.string());
    }
}

std::string DirectoryName(int number, const std::string& timestamp) {
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "game_%03d_", number);
    return std::string(prefix) + timestamp;
}

}  // namespace

nlohmann::json ExecutionRecordToJson(const sandbox::ExecutionRecord& record) {
    return {
        {"success", record.success},
        {"stdout", record.output},
        {"stderr", record.error},
        {"returncode", record.exit_code},
        {"execution_time", record.duration.count()}
    };
}

bool ArtifactStore::IsArtifactDirectoryName(const std::string& name) {
    static const std::regex kPattern(R"(game_\d{3,}_\d{8}_\d{6})");
    return std::regex_match(name, kPattern);
}

int ArtifactStore::NextSequenceNumber(const std::filesystem::path& root) {
    int existing = 0;
    if (!std::filesystem::is_directory(root)) {
        return 1;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        if (entry.is_directory() && IsArtifactDirectoryName(entry.path().filename().string())) {
            ++existing;
        }
    }
    return existing + 1;
}

SavedArtifact ArtifactStore::Save(const std::string& source,
                                  const sandbox::ExecutionRecord& record,
                                  const std::filesystem::path& root) {
    std::filesystem::create_directories(root);
    const auto number = NextSequenceNumber(root);
    const auto timestamp = utils::FormatLocalTime(utils::Now(), "%Y%m%d_%H%M%S");

    SavedArtifact artifact{};
    artifact.directory_path = root / DirectoryName(number, timestamp);
    std::filesystem::create_directories(artifact.directory_path);

    artifact.source_file_path = artifact.directory_path / kSourceFile;
    WriteText(artifact.source_file_path, source);

    artifact.record_file_path = artifact.directory_path / kRecordFile;
    const auto document = ExecutionRecordToJson(record).dump(
        2, ' ', false, nlohmann::json::error_handler_t::replace);
    WriteText(artifact.record_file_path, document + "\n");

    utils::Log(utils::LogLevel::kInfo, "store", "saved " + artifact.directory_path.string());
    return artifact;
}

}  // namespace gamesmith::game

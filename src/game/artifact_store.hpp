#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace gamesmith::game {

struct SavedArtifact {
    std::filesystem::path directory_path;
    std::filesystem::path source_file_path;
    std::filesystem::path record_file_path;
};

nlohmann::json ExecutionRecordToJson(const sandbox::ExecutionRecord& record);

// Writes attempts into numbered `game_<NNN>_<YYYYMMDD_HHMMSS>` directories.
// Numbering counts existing siblings at creation time and takes no lock, so
// concurrent writers against one root may collide or skip numbers.
class ArtifactStore {
public:
    static SavedArtifact Save(const std::string& source,
                              const sandbox::ExecutionRecord& record,
                              const std::filesystem::path& root);

    static int NextSequenceNumber(const std::filesystem::path& root);
    static bool IsArtifactDirectoryName(const std::string& name);
};

}  // namespace gamesmith::game

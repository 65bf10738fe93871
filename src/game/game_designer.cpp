#include "game/game_designer.hpp"

#include <exception>

#include "game/code_extractor.hpp"
#include "game/structure_validator.hpp"
#include "utils/logging.hpp"

namespace gamesmith::game {

DesignResult InspectResponse(const std::string& raw_response) {
    DesignResult result{};
    result.raw_response = raw_response;
    result.code = CodeExtractor::Extract(raw_response);
    const auto outcome = StructureValidator::Validate(result.code);
    result.valid = outcome.is_valid;
    result.error = outcome.reason;
    return result;
}

GameDesigner::GameDesigner(TextGenerator& generator)
    : generator_(generator) {}

DesignResult GameDesigner::Design(const std::string& prompt) const {
    const auto started = std::chrono::steady_clock::now();
    std::string response;
    try {
        response = generator_.Generate(prompt);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "design", std::string("generator failed: ") + ex.what());
        DesignResult failed{};
        failed.error = std::string("API error: ") + ex.what();
        failed.response_time = std::chrono::steady_clock::now() - started;
        return failed;
    }
    auto result = InspectResponse(response);
    result.response_time = std::chrono::steady_clock::now() - started;
    utils::Log(utils::LogLevel::kInfo, "design",
               std::string(result.valid ? "accepted" : "declined") + " candidate: " + result.error);
    return result;
}

}  // namespace gamesmith::game

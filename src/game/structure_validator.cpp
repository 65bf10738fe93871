#include "game/structure_validator.hpp"

#include <algorithm>

#include "python/python_frontend.hpp"
#include "utils/logging.hpp"

namespace gamesmith::game {
namespace {

constexpr const char* kEntryType = "Game";
constexpr const char* kEntryMethod = "play";

ValidationOutcome Reject(std::string reason) {
    utils::Log(utils::LogLevel::kDebug, "validate", "rejected: " + reason);
    return ValidationOutcome{false, std::move(reason)};
}

}  // namespace

ValidationOutcome StructureValidator::Validate(const std::string& source) {
    const auto parsed = python::PythonFrontend::Parse(source);
    switch (parsed.status) {
        case python::ParseStatus::kSyntaxError: {
            std::string reason = "syntax error: " + parsed.message;
            if (parsed.line > 0) {
                reason += " at line " + std::to_string(parsed.line);
            }
            return Reject(std::move(reason));
        }
        case python::ParseStatus::kInternalError:
            return Reject("validation error: " + parsed.message);
        case python::ParseStatus::kOk:
            break;
    }

    const auto game = std::find_if(parsed.classes.begin(), parsed.classes.end(),
                                   [](const python::ClassOutline& outline) {
                                       return outline.name == kEntryType;
                                   });
    if (game == parsed.classes.end()) {
        return Reject("no 'Game' type found");
    }
    const auto& methods = game->methods;
    if (std::find(methods.begin(), methods.end(), kEntryMethod) == methods.end()) {
        return Reject("no 'play' method found in Game");
    }
    return ValidationOutcome{true, "valid"};
}

}  // namespace gamesmith::game

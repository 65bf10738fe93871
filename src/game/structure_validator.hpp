#pragma once

#include <string>

namespace gamesmith::game {

struct ValidationOutcome {
    bool is_valid = false;
    std::string reason;
};

// Checks that candidate source declares a module-level `class Game` with a
// `play` method, without running it.
class StructureValidator {
public:
    static ValidationOutcome Validate(const std::string& source);
};

}  // namespace gamesmith::game

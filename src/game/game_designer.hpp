#pragma once

#include <chrono>
#include <string>

namespace gamesmith::game {

// Upstream text source, typically a model call. Implementations may throw.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string Generate(const std::string& prompt) = 0;
};

struct DesignResult {
    std::string code;
    bool valid = false;
    std::string error;
    std::string raw_response;
    std::chrono::duration<double> response_time{0.0};
};

// Extracts and validates a response that was already obtained.
DesignResult InspectResponse(const std::string& raw_response);

class GameDesigner {
public:
    explicit GameDesigner(TextGenerator& generator);

    DesignResult Design(const std::string& prompt) const;

private:
    TextGenerator& generator_;
};

}  // namespace gamesmith::game

#pragma once

#include <string>
#include <vector>

namespace gamesmith::python {

enum class ParseStatus {
    kOk,
    kSyntaxError,
    kInternalError
};

struct ClassOutline {
    std::string name;
    int line = 0;
    // Plain `def` members of the class body, in source order.
    std::vector<std::string> methods;
};

struct ParseResult {
    ParseStatus status = ParseStatus::kInternalError;
    std::string message;
    int line = 0;
    std::vector<ClassOutline> classes;
};

// Static inspection of Python source through CPython's own `ast` module.
// The source is parsed only; it is never compiled to bytecode or executed.
class PythonFrontend {
public:
    static ParseResult Parse(const std::string& source);
};

}  // namespace gamesmith::python

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace scriptbox::script {

inline constexpr const char* kEntryPointName = "main";

// Raised for source text that cannot be parsed. Line and column are 1-based;
// 0 means the position is unknown.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(std::string message, int line, int column);

    const std::string& Message() const { return message_; }
    int Line() const { return line_; }
    int Column() const { return column_; }

private:
    std::string message_;
    int line_ = 0;
    int column_ = 0;
};

struct ValidationOutcome {
    bool has_entry_point = false;
    // Other top-level functions, in definition order, without duplicates.
    std::vector<std::string> other_functions;
};

// Structural scan of Python 3 source: tokenizes just enough to track
// strings, brackets, line joining and indentation, and collects the names of
// top-level `def` / `async def` statements. Nothing is evaluated.
// Throws SyntaxError.
ValidationOutcome ValidateEntryPoint(std::string_view script);

}  // namespace scriptbox::script

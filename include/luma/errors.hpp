#pragma once
#include <stdexcept>
#include <string>

namespace luma {

// Raised when a grammar handle cannot be loaded (null, wrong ABI version, malformed tables).
struct LanguageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised by Parser::parse for unrecoverable input and by strict-mode parsing.
// line/col are 1-based; 0 means "no position".
struct ParseError : std::runtime_error {
    ParseError(const std::string& message, int line = 0, int col = 0)
        : std::runtime_error(message), line(line), col(col) {}
    int line{0};
    int col{0};
};

// Input nested deeper than ParseOptions::max_depth.
struct NestingError : ParseError {
    using ParseError::ParseError;
};

struct CorpusError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace luma

#pragma once

#include "advent/core/Severity.h"

#include <string>

namespace advent {

// Non-fatal finding raised while solving a puzzle, e.g. an input line that
// does not have the expected shape. Fatal conditions are llvm::Error values.
struct Diagnostic {
    std::string puzzleID;  // stamped by the driver; solvers leave it empty
    Severity    severity = Severity::Warning;
    unsigned    line     = 0;  // 1-based index into the solver's input lines
    std::string lineText;
    std::string message;
};

} // namespace advent

#pragma once

#include "advent/core/Diagnostic.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace advent {

class Puzzle {
public:
    virtual ~Puzzle() = default;

    virtual std::string_view getID() const = 0;
    virtual std::string_view getTitle() const = 0;

    // Input file name, resolved against the configured input root.
    virtual std::string_view getDefaultInput() const = 0;

    // Solve for the given input lines. Non-fatal findings are appended to
    // `diagnostics`; malformed numeric fields fail the whole solve.
    virtual llvm::Expected<int64_t> solve(llvm::ArrayRef<std::string> lines,
                                          std::vector<Diagnostic> &diagnostics) const = 0;
};

} // namespace advent

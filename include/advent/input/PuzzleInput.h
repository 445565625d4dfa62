#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace advent {

// Join `name` onto `root` (unless `name` is already absolute) and return the
// canonical path. Fails with InputError if the file cannot be resolved.
llvm::Expected<std::string> resolveInputPath(llvm::StringRef root,
                                             llvm::StringRef name);

// Read a whole puzzle input and split it with splitLines().
llvm::Expected<std::vector<std::string>> readLines(llvm::StringRef path);

// Split text on '\n', dropping a trailing '\r' from each line. A final line
// terminator does not produce an extra empty line.
std::vector<std::string> splitLines(llvm::StringRef text);

} // namespace advent

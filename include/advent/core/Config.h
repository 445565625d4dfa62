#pragma once

#include <llvm/ADT/StringRef.h>

#include <map>
#include <string>

namespace advent {

struct Config {
    // Directory that puzzle default inputs are resolved against
    std::string inputRoot       = "puzzle-inputs";

    // Output
    std::string format          = "cli";  // cli | json
    std::string outputFile;               // empty = stdout

    // Echo malformed-line diagnostics to stderr
    bool reportMalformedLines   = true;

    // Per-puzzle input file overrides, keyed by puzzle ID
    std::map<std::string, std::string> inputs;

    static Config loadFromFile(const std::string &path);
    static Config loadFromString(llvm::StringRef text, llvm::StringRef origin);
    static Config defaults();
};

} // namespace advent

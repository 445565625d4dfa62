#include "advent/output/OutputFormatter.h"
#include "advent/core/Version.h"

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

namespace advent {

namespace {

// json::Value requires valid UTF-8; puzzle input lines are arbitrary bytes.
llvm::json::Value text(const std::string &s) {
    if (llvm::json::isUTF8(s))
        return s;
    return llvm::json::fixUTF8(s);
}

void writeResults(llvm::json::OStream &J, const std::vector<PuzzleResult> &results) {
    J.attributeArray("results", [&] {
        for (const auto &r : results) {
            J.object([&] {
                J.attribute("puzzle", text(r.puzzleID));
                J.attribute("title", text(r.title));
                J.attribute("input", text(r.inputPath));
                J.attribute("solved", r.solved);
                if (r.solved)
                    J.attribute("answer", r.answer);
                else
                    J.attribute("error", text(r.error));

                J.attributeArray("diagnostics", [&] {
                    for (const auto &d : r.diagnostics) {
                        J.object([&] {
                            J.attribute("puzzle", text(d.puzzleID));
                            J.attribute("severity", llvm::StringRef(severityToString(d.severity)));
                            J.attribute("line", static_cast<int64_t>(d.line));
                            J.attribute("text", text(d.lineText));
                            J.attribute("message", text(d.message));
                        });
                    }
                });
            });
        }
    });
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<PuzzleResult> &results) {
    std::string out;
    llvm::raw_string_ostream os(out);
    {
        llvm::json::OStream J(os, /*IndentSize=*/2);
        J.object([&] {
            J.attribute("version", kToolVersion);
            writeResults(J, results);
        });
    }
    os << "\n";
    return os.str();
}

std::string JSONOutputFormatter::format(const std::vector<PuzzleResult> &results,
                                        const RunMetadata &meta) {
    std::string out;
    llvm::raw_string_ostream os(out);
    {
        llvm::json::OStream J(os, /*IndentSize=*/2);
        J.object([&] {
            J.attribute("version", text(meta.toolVersion));
            J.attributeObject("run", [&] {
                J.attribute("config", text(meta.configPath));
                J.attribute("inputRoot", text(meta.inputRoot));
                J.attribute("timestamp", static_cast<int64_t>(meta.timestampEpochSec));
            });
            writeResults(J, results);
        });
    }
    os << "\n";
    return os.str();
}

} // namespace advent

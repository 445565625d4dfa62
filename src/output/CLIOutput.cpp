#include "advent/output/OutputFormatter.h"

#include <sstream>

namespace advent {

std::string CLIOutputFormatter::format(const std::vector<PuzzleResult> &results) {
    std::ostringstream os;
    size_t failed = 0;

    for (const auto &r : results) {
        os << r.puzzleID << " (" << r.title << "): ";
        if (r.solved) {
            os << r.answer << "\n";
        } else {
            os << "error: " << r.error << "\n";
            ++failed;
        }

        if (!r.inputPath.empty())
            os << "  Input: " << r.inputPath << "\n";

        for (const auto &d : r.diagnostics)
            os << "  " << severityToString(d.severity) << ": line " << d.line
               << ": " << d.message << ": '" << d.lineText << "'\n";
    }

    if (results.empty())
        os << "advent: no puzzles run.\n";
    else
        os << "advent: " << (results.size() - failed) << " puzzle(s) solved, "
           << failed << " failed.\n";

    return os.str();
}

} // namespace advent

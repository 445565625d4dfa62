#include "advent/day02/Reports.h"
#include "advent/core/Error.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/MathExtras.h>

namespace advent {

llvm::Expected<std::vector<Report>> parseReports(llvm::ArrayRef<std::string> lines) {
    std::vector<Report> reports;
    reports.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        llvm::StringRef line = llvm::StringRef(lines[i]).trim();
        if (line.empty())
            continue;

        llvm::SmallVector<llvm::StringRef, 8> fields;
        llvm::SplitString(line, fields);

        Report report;
        report.reserve(fields.size());
        for (llvm::StringRef field : fields) {
            int64_t level = 0;
            if (field.getAsInteger(10, level))
                return llvm::make_error<ParseError>(static_cast<unsigned>(i + 1),
                                                    field.str(), line.str());
            report.push_back(level);
        }
        reports.push_back(std::move(report));
    }

    return reports;
}

bool isSafe(llvm::ArrayRef<int64_t> levels) {
    unsigned increasing = 0;
    unsigned decreasing = 0;

    for (size_t i = 1; i < levels.size(); ++i) {
        int64_t delta = 0;
        if (llvm::SubOverflow(levels[i], levels[i - 1], delta))
            return false;  // far outside [1, 3]
        if (delta > 0)
            ++increasing;
        else if (delta < 0)
            ++decreasing;

        if (delta == 0 || delta < -3 || delta > 3)
            return false;
    }

    return increasing == 0 || decreasing == 0;
}

bool isSafeWithDampener(llvm::ArrayRef<int64_t> levels) {
    if (isSafe(levels))
        return true;

    Report trimmed;
    trimmed.reserve(levels.size());
    for (size_t skip = 0; skip < levels.size(); ++skip) {
        trimmed.clear();
        for (size_t i = 0; i < levels.size(); ++i) {
            if (i != skip)
                trimmed.push_back(levels[i]);
        }
        if (isSafe(trimmed))
            return true;
    }
    return false;
}

} // namespace advent

#include "advent/day01/LocationLists.h"
#include "advent/core/Error.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/MathExtras.h>
#include <llvm/Support/Regex.h>

#include <algorithm>
#include <system_error>
#include <unordered_map>

namespace advent {

namespace {

constexpr const char kPairPattern[] = "^([0-9]+)[[:space:]]+([0-9]+)$";

llvm::Expected<int64_t> parseField(llvm::StringRef field, unsigned lineNo,
                                   llvm::StringRef lineText) {
    int64_t value = 0;
    // getAsInteger returns true on failure (non-digits or overflow).
    if (field.getAsInteger(10, value))
        return llvm::make_error<ParseError>(lineNo, field.str(), lineText.str());
    return value;
}

} // anonymous namespace

llvm::Expected<LocationLists> parseLocationLists(llvm::ArrayRef<std::string> lines,
                                                 std::vector<Diagnostic> &diagnostics) {
    llvm::Regex pairRegex(kPairPattern);
    std::string regexError;
    if (!pairRegex.isValid(regexError))
        return llvm::createStringError(std::errc::invalid_argument,
                                       "bad pair pattern: %s", regexError.c_str());

    LocationLists lists;
    lists.left.reserve(lines.size());
    lists.right.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        unsigned lineNo = static_cast<unsigned>(i + 1);
        llvm::StringRef line = llvm::StringRef(lines[i]).trim();
        if (line.empty())
            continue;

        llvm::SmallVector<llvm::StringRef, 3> captures;
        if (!pairRegex.match(line, &captures)) {
            Diagnostic diag;
            diag.severity = Severity::Warning;
            diag.line     = lineNo;
            diag.lineText = lines[i];
            diag.message  = "expected two integers separated by whitespace, line skipped";
            diagnostics.push_back(std::move(diag));
            continue;
        }

        auto left = parseField(captures[1], lineNo, line);
        if (!left)
            return left.takeError();
        auto right = parseField(captures[2], lineNo, line);
        if (!right)
            return right.takeError();

        lists.left.push_back(*left);
        lists.right.push_back(*right);
    }

    return lists;
}

llvm::Expected<int64_t> totalDistance(LocationLists lists) {
    if (lists.left.size() != lists.right.size())
        return llvm::make_error<LengthMismatchError>(lists.left.size(),
                                                     lists.right.size());

    std::sort(lists.left.begin(), lists.left.end());
    std::sort(lists.right.begin(), lists.right.end());

    int64_t total = 0;
    for (size_t i = 0; i < lists.left.size(); ++i) {
        int64_t hi = std::max(lists.left[i], lists.right[i]);
        int64_t lo = std::min(lists.left[i], lists.right[i]);
        int64_t distance = 0;
        if (llvm::SubOverflow(hi, lo, distance) ||
            llvm::AddOverflow(total, distance, total))
            return llvm::make_error<OverflowError>("total distance");
    }
    return total;
}

llvm::Expected<int64_t> similarityScore(const LocationLists &lists) {
    std::unordered_map<int64_t, int64_t> counts;
    for (int64_t v : lists.right)
        ++counts[v];

    int64_t score = 0;
    for (int64_t v : lists.left) {
        auto it = counts.find(v);
        if (it == counts.end())
            continue;
        int64_t weighted = 0;
        if (llvm::MulOverflow(v, it->second, weighted) ||
            llvm::AddOverflow(score, weighted, score))
            return llvm::make_error<OverflowError>("similarity score");
    }
    return score;
}

} // namespace advent

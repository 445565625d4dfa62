#include "advent/input/PuzzleInput.h"
#include "advent/core/Error.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>

namespace advent {

llvm::Expected<std::string> resolveInputPath(llvm::StringRef root,
                                             llvm::StringRef name) {
    llvm::SmallString<256> joined;
    if (llvm::sys::path::is_absolute(name)) {
        joined = name;
    } else {
        joined = root;
        llvm::sys::path::append(joined, name);
    }

    llvm::SmallString<256> real;
    if (std::error_code EC = llvm::sys::fs::real_path(joined, real))
        return llvm::make_error<InputError>(std::string(joined), EC, "resolve");

    return std::string(real);
}

llvm::Expected<std::vector<std::string>> readLines(llvm::StringRef path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!bufOrErr)
        return llvm::make_error<InputError>(path.str(), bufOrErr.getError(), "read");

    return splitLines(bufOrErr.get()->getBuffer());
}

std::vector<std::string> splitLines(llvm::StringRef text) {
    llvm::SmallVector<llvm::StringRef, 64> pieces;
    text.split(pieces, '\n', /*MaxSplit=*/-1, /*KeepEmpty=*/true);

    // "a\nb\n" splits into {"a", "b", ""}; the last piece is not a line.
    if (!pieces.empty() && pieces.back().empty())
        pieces.pop_back();

    std::vector<std::string> lines;
    lines.reserve(pieces.size());
    for (llvm::StringRef piece : pieces) {
        if (piece.endswith("\r"))
            piece = piece.drop_back();
        lines.push_back(piece.str());
    }
    return lines;
}

} // namespace advent

#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace advent {

// A field that was expected to hold an integer could not be converted.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
    static char ID;

    ParseError(unsigned line, std::string field, std::string lineText)
        : line_(line), field_(std::move(field)), lineText_(std::move(lineText)) {}

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override;

    unsigned line() const { return line_; }
    const std::string &field() const { return field_; }
    const std::string &lineText() const { return lineText_; }

private:
    unsigned line_;
    std::string field_;
    std::string lineText_;
};

// Left and right location lists cannot be paired positionally.
class LengthMismatchError : public llvm::ErrorInfo<LengthMismatchError> {
public:
    static char ID;

    LengthMismatchError(size_t leftSize, size_t rightSize)
        : leftSize_(leftSize), rightSize_(rightSize) {}

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override;

    size_t leftSize() const { return leftSize_; }
    size_t rightSize() const { return rightSize_; }

private:
    size_t leftSize_;
    size_t rightSize_;
};

// An answer does not fit in int64_t.
class OverflowError : public llvm::ErrorInfo<OverflowError> {
public:
    static char ID;

    explicit OverflowError(std::string what) : what_(std::move(what)) {}

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::string what_;
};

// A puzzle input could not be located or read.
class InputError : public llvm::ErrorInfo<InputError> {
public:
    static char ID;

    InputError(std::string path, std::error_code EC, std::string action)
        : path_(std::move(path)), EC_(EC), action_(std::move(action)) {}

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override { return EC_; }

    const std::string &path() const { return path_; }

private:
    std::string path_;
    std::error_code EC_;
    std::string action_;
};

} // namespace advent

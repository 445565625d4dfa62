#include "advent/core/Error.h"

namespace advent {

char ParseError::ID = 0;
char LengthMismatchError::ID = 0;
char OverflowError::ID = 0;
char InputError::ID = 0;

void ParseError::log(llvm::raw_ostream &OS) const {
    OS << "line " << line_ << ": cannot parse '" << field_
       << "' as an integer in '" << lineText_ << "'";
}

std::error_code ParseError::convertToErrorCode() const {
    return std::make_error_code(std::errc::invalid_argument);
}

void LengthMismatchError::log(llvm::raw_ostream &OS) const {
    OS << "location lists differ in length (left=" << leftSize_
       << ", right=" << rightSize_ << ")";
}

std::error_code LengthMismatchError::convertToErrorCode() const {
    return std::make_error_code(std::errc::invalid_argument);
}

void OverflowError::log(llvm::raw_ostream &OS) const {
    OS << what_ << " overflows a 64-bit signed integer";
}

std::error_code OverflowError::convertToErrorCode() const {
    return std::make_error_code(std::errc::value_too_large);
}

void InputError::log(llvm::raw_ostream &OS) const {
    OS << "cannot " << action_ << " '" << path_ << "': " << EC_.message();
}

} // namespace advent

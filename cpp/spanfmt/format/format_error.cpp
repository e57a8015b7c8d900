#include "spanfmt/format/format_error.h"

namespace spanfmt {

const char* formatErrorName(FormatError error) {
    switch (error) {
        case FormatError::Ok: return "Ok";
        case FormatError::MalformedSpecifier: return "MalformedSpecifier";
        case FormatError::IndexOutOfRange: return "IndexOutOfRange";
        case FormatError::UnsupportedConversion: return "UnsupportedConversion";
        case FormatError::InvalidRange: return "InvalidRange";
    }
    return "Unknown";
}

FormatException::FormatException(FormatError code, const std::string& message)
    : std::runtime_error(std::string(formatErrorName(code)) + ": " + message), code_(code) {}

} // namespace spanfmt

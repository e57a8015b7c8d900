#ifndef SPANFMT_FORMAT_FORMAT_ERROR_H
#define SPANFMT_FORMAT_FORMAT_ERROR_H

#include "spanfmt/types.h"
#include <stdexcept>
#include <string>

namespace spanfmt {

// Thrown for every fatal formatting or buffer error. The code identifies the category.
class FormatException : public std::runtime_error {
public:
    FormatException(FormatError code, const std::string& message);

    FormatError code() const noexcept { return code_; }

private:
    FormatError code_;
};

} // namespace spanfmt

#endif // SPANFMT_FORMAT_FORMAT_ERROR_H

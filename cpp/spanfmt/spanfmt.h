#ifndef SPANFMT_SPANFMT_H
#define SPANFMT_SPANFMT_H

// Public interface: styled text, styles, and printf-style formatting over styled text.

#include "spanfmt/types.h"
#include "spanfmt/text/style.h"
#include "spanfmt/text/styled_text.h"
#include "spanfmt/text/style_helpers.h"
#include "spanfmt/format/format_error.h"
#include "spanfmt/format/argument.h"
#include "spanfmt/format/value_formatter.h"
#include "spanfmt/format/span_formatter.h"

#endif // SPANFMT_SPANFMT_H

#include "spanfmt/format/span_formatter.h"
#include "spanfmt/core/logging.h"
#include "spanfmt/format/format_error.h"
#include <cstdlib>
#include <string>

namespace spanfmt {

namespace {

// Parse "N$" into a 0-based index.
std::int64_t parseExplicitIndex(const std::string& argTerm) {
    const std::string digits = argTerm.substr(0, argTerm.size() - 1);
    if (digits.empty() || digits.size() > 9 || digits.find_first_not_of("0123456789") != std::string::npos) {
        SPANFMT_LOG_WARN("malformed argument index \"%s\"", argTerm.c_str());
        throw FormatException(FormatError::MalformedSpecifier, "malformed argument index \"" + argTerm + "\"");
    }
    const long position = std::strtol(digits.c_str(), nullptr, 10);
    if (position < 1) {
        SPANFMT_LOG_WARN("argument index \"%s\" is not positive", argTerm.c_str());
        throw FormatException(FormatError::MalformedSpecifier, "argument index \"" + argTerm + "\" is not positive");
    }
    return static_cast<std::int64_t>(position) - 1;
}

} // namespace

SpanFormatter::SpanFormatter() : values_(std::locale()) {}

SpanFormatter::SpanFormatter(std::optional<std::locale> locale) : values_(std::move(locale)) {}

text::StyledText SpanFormatter::format(const text::StyledText& tmpl, const std::vector<Argument>& args) const {
    text::StyledText out = tmpl;

    std::uint32_t cursor = 0;
    // Last resolved argument index; -1 until one is consumed
    std::int64_t lastIndex = -1;

    while (cursor < out.length()) {
        const std::optional<ConversionSpecifier> spec = findNextSpecifier(out.content(), cursor);
        if (!spec) {
            break;
        }

        text::StyledText plain;
        const text::StyledText* replacement = &plain;
        if (spec->isLiteralPercent()) {
            plain = "%";
        } else if (spec->isLineSeparator()) {
            plain = "\n";
        } else {
            const std::int64_t index = resolveIndex(*spec, lastIndex, args.size());
            const Argument& arg = args[static_cast<std::size_t>(index)];
            const text::StyledText* styled = arg.get<text::StyledText>();
            if (spec->conversionTerm == "s" && styled) {
                replacement = styled;
            } else {
                plain = values_.format(spec->modifierTerm, spec->conversionTerm, arg);
            }
            SPANFMT_LOG_DEBUG("%%%s%s%s at [%u, %u) -> argument %lld (%s)", spec->argTerm.c_str(),
                              spec->modifierTerm.c_str(), spec->conversionTerm.c_str(), spec->start,
                              spec->end, static_cast<long long>(index), arg.kindName());
        }

        const std::uint32_t inserted = replacement->length();
        out.replace(spec->start, spec->end, *replacement);

        // Resume after the inserted text; it is never scanned for specifiers
        cursor = spec->start + inserted;
    }

    return out;
}

std::int64_t SpanFormatter::resolveIndex(const ConversionSpecifier& spec, std::int64_t& lastIndex,
                                         std::size_t argCount) const {
    std::int64_t index = -1;
    switch (spec.selector()) {
        case ArgSelector::Implicit:
            index = lastIndex + 1;
            break;
        case ArgSelector::Explicit:
            index = parseExplicitIndex(spec.argTerm);
            break;
        case ArgSelector::Relative:
            index = lastIndex;
            break;
    }
    lastIndex = index;

    if (index < 0 || static_cast<std::size_t>(index) >= argCount) {
        SPANFMT_LOG_WARN("argument index %lld out of range for %zu arguments",
                         static_cast<long long>(index), argCount);
        throw FormatException(FormatError::IndexOutOfRange,
                              "argument index " + std::to_string(index) + " out of range for " +
                                  std::to_string(argCount) + " arguments");
    }
    return index;
}

} // namespace spanfmt

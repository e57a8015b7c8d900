#ifndef SPANFMT_FORMAT_SPAN_FORMATTER_H
#define SPANFMT_FORMAT_SPAN_FORMATTER_H

#include "spanfmt/format/argument.h"
#include "spanfmt/format/specifier_scanner.h"
#include "spanfmt/format/value_formatter.h"
#include "spanfmt/text/styled_text.h"
#include <cstdint>
#include <locale>
#include <optional>
#include <utility>
#include <vector>

namespace spanfmt {

/**
 * SpanFormatter: printf-style formatting that preserves style attachments.
 *
 * The template is copied into a working buffer and every specifier is
 * spliced in place. A "%s" whose argument is a StyledText inserts that text
 * with its attachments (the modifier term is ignored); every other
 * conversion inserts the plain rendering of ValueFormatter. Scanning resumes
 * after each inserted replacement, so argument text is never parsed as a
 * specifier.
 *
 * A style object can only be carried by one range of the result: when the
 * same styled argument is substituted more than once, only the first
 * occurrence keeps its attachments and later ones are plain text.
 *
 * Errors throw FormatException and leave no partial result:
 * - MalformedSpecifier: explicit index that is not a positive integer
 * - IndexOutOfRange: index outside the argument list, including "%<"
 *   before any argument was consumed
 * - UnsupportedConversion: rejected by ValueFormatter
 */
class SpanFormatter {
public:
    // Formats with the global C++ locale.
    SpanFormatter();

    // std::nullopt disables localization.
    explicit SpanFormatter(std::optional<std::locale> locale);

    /**
     * Format a template.
     * @param tmpl Template, possibly carrying attachments
     * @param args Arguments; extra ones are ignored
     * @return The formatted text
     */
    text::StyledText format(const text::StyledText& tmpl, const std::vector<Argument>& args) const;

private:
    ValueFormatter values_;

    // Implicit: lastIndex + 1. Explicit "N$": N - 1. Relative "<": lastIndex.
    // The resolved index becomes lastIndex.
    std::int64_t resolveIndex(const ConversionSpecifier& spec, std::int64_t& lastIndex,
                              std::size_t argCount) const;
};

// =============================================================================
// Entry Points
// =============================================================================

// Format with the global C++ locale.
template <typename... Args>
text::StyledText format(const text::StyledText& tmpl, Args&&... args) {
    return SpanFormatter().format(tmpl, std::vector<Argument>{Argument(std::forward<Args>(args))...});
}

// Format with an explicit locale; std::nullopt disables localization.
template <typename... Args>
text::StyledText format(std::optional<std::locale> locale, const text::StyledText& tmpl, Args&&... args) {
    return SpanFormatter(std::move(locale))
        .format(tmpl, std::vector<Argument>{Argument(std::forward<Args>(args))...});
}

} // namespace spanfmt

#endif // SPANFMT_FORMAT_SPAN_FORMATTER_H

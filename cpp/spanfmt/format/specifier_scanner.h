#ifndef SPANFMT_FORMAT_SPECIFIER_SCANNER_H
#define SPANFMT_FORMAT_SPECIFIER_SCANNER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace spanfmt {

enum class ArgSelector : std::uint8_t {
    Implicit = 0,   // Next sequential argument
    Explicit = 1,   // "N$", 1-based
    Relative = 2,   // "<", index of the previous specifier
};

/**
 * A conversion specifier matched in a buffer.
 *
 * The three captured terms of "%<arg><modifiers><conversion>" are kept
 * verbatim; start/end locate the whole specifier in the scanned text.
 */
struct ConversionSpecifier {
    std::uint32_t start;        // Offset of '%'
    std::uint32_t end;          // One past the conversion term
    std::string argTerm;        // "", "N$" or "<"
    std::string modifierTerm;   // Flags, width, precision
    std::string conversionTerm; // One letter, 't'/'T' plus a letter, or "%"

    ArgSelector selector() const;

    bool isLiteralPercent() const { return conversionTerm == "%"; }
    bool isLineSeparator() const { return conversionTerm == "n"; }
};

/**
 * Find the leftmost conversion specifier at or after an offset.
 *
 * Grammar after '%':
 *   arg:        empty | [0-9]+ '$' | '<'
 *   modifiers:  any characters except ASCII letters, '%' and '[' to '`'
 *   conversion: [a-zA-Z] except t/T | [tT][a-zA-Z] | '%'
 *
 * A '%' without a valid conversion term is skipped. Never throws.
 *
 * @param text Text to scan
 * @param from Offset to start scanning at
 * @return The match, or nullopt if none remains
 */
std::optional<ConversionSpecifier> findNextSpecifier(std::string_view text, std::uint32_t from);

} // namespace spanfmt

#endif // SPANFMT_FORMAT_SPECIFIER_SCANNER_H

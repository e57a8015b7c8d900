#ifndef SPANFMT_FORMAT_VALUE_FORMATTER_H
#define SPANFMT_FORMAT_VALUE_FORMATTER_H

#include "spanfmt/format/argument.h"
#include <locale>
#include <optional>
#include <string>
#include <string_view>

namespace spanfmt {

// Parsed "[flags][width][.precision]" modifier term.
struct FormatModifiers {
    bool leftJustify = false;   // '-'
    bool alternate = false;     // '#'
    bool plus = false;          // '+'
    bool space = false;         // ' '
    bool zeroPad = false;       // '0'
    bool group = false;         // ','
    bool parentheses = false;   // '('
    std::optional<int> width;
    std::optional<int> precision;

    /**
     * Parse a modifier term.
     * @throws FormatException(UnsupportedConversion) on duplicate flags,
     *         conflicting flags or trailing characters
     */
    static FormatModifiers parse(std::string_view term);
};

/**
 * ValueFormatter: converts one plain argument for one conversion.
 *
 * Numbers are rendered with fmt and then localized: decimal point and
 * grouping separator come from the locale's numpunct facet, month and day
 * names from its time_put facet. Without a locale no localization is applied
 * ('.' decimal point, ',' grouping in threes).
 */
class ValueFormatter {
public:
    explicit ValueFormatter(std::optional<std::locale> locale = std::nullopt);

    /**
     * Render an argument.
     * @param modifierTerm Flags, width and precision, e.g. "-10.3"
     * @param conversionTerm Conversion letter, or 't'/'T' plus a letter
     * @param arg Argument value (styled text is rendered as its plain content)
     * @return Plain text
     * @throws FormatException(UnsupportedConversion) if the conversion, the
     *         modifiers and the argument kind do not fit together
     */
    std::string format(std::string_view modifierTerm, std::string_view conversionTerm,
                       const Argument& arg) const;

private:
    std::optional<std::locale> locale_;
    char decimalPoint_;
    char groupingSeparator_;
    std::string grouping_;

    std::string formatBoolean(const FormatModifiers& mods, const Argument& arg) const;
    std::string formatHash(const FormatModifiers& mods, const Argument& arg) const;
    std::string formatString(const FormatModifiers& mods, const Argument& arg) const;
    std::string formatCharacter(const FormatModifiers& mods, const Argument& arg) const;
    std::string formatDecimal(const FormatModifiers& mods, const Argument& arg) const;
    std::string formatUnsignedRadix(const FormatModifiers& mods, char conversion, const Argument& arg) const;
    std::string formatFloating(const FormatModifiers& mods, char conversion, const Argument& arg) const;
    std::string formatDateTime(const FormatModifiers& mods, char field, const Argument& arg) const;

    std::string dateField(const DateTime& dt, char field) const;
    std::string strftimeLocalized(const std::tm& calendar, const char* pattern) const;

    std::string groupDigits(std::string_view digits) const;
    std::string signAndPad(std::string magnitude, bool negative, const FormatModifiers& mods,
                           std::size_t zeroOffset = 0) const;
    std::string justify(std::string s, const FormatModifiers& mods) const;
    std::string toUpper(std::string s) const;
    std::string toLower(std::string s) const;
};

} // namespace spanfmt

#endif // SPANFMT_FORMAT_VALUE_FORMATTER_H

#include "spanfmt/format/value_formatter.h"
#include "spanfmt/core/logging.h"
#include "spanfmt/core/string_utils.h"
#include "spanfmt/format/format_error.h"
#include "spanfmt/types.h"

#include <fmt/format.h>
#include <fmt/printf.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

namespace spanfmt {

namespace {

[[noreturn]] void reject(const std::string& message) {
    SPANFMT_LOG_WARN("%s", message.c_str());
    throw FormatException(FormatError::UnsupportedConversion, message);
}

std::string flagString(const FormatModifiers& mods) {
    std::string flags;
    if (mods.leftJustify) flags += '-';
    if (mods.alternate) flags += '#';
    if (mods.plus) flags += '+';
    if (mods.space) flags += ' ';
    if (mods.zeroPad) flags += '0';
    if (mods.group) flags += ',';
    if (mods.parentheses) flags += '(';
    return flags;
}

// Reject flags outside the allowed set and precision where it has no meaning.
void checkModifiers(const FormatModifiers& mods, const char* allowedFlags, bool allowPrecision,
                    std::string_view conversion) {
    for (char flag : flagString(mods)) {
        if (!std::strchr(allowedFlags, flag)) {
            reject(fmt::format("flag '{}' does not apply to conversion '{}'", flag, conversion));
        }
    }
    if (!allowPrecision && mods.precision) {
        reject(fmt::format("precision does not apply to conversion '{}'", conversion));
    }
}

// Truncate to at most maxCodepoints code points.
std::string truncateCodepoints(std::string s, std::optional<int> maxCodepoints) {
    if (!maxCodepoints) return s;
    std::size_t pos = 0;
    for (int i = 0; i < *maxCodepoints && pos < s.size(); ++i) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(s, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
    }
    s.resize(pos);
    return s;
}

// Shortest round-trip rendering of a finite non-zero magnitude, in the style
// of Double.toString: plain decimal in [1e-3, 1e7), otherwise d.dddE[-]n.
std::string shortestDecimal(double magnitude) {
    const std::string s = fmt::format("{}", magnitude);

    std::string mantissa = s;
    long exp10 = 0;
    const std::size_t e = s.find('e');
    if (e != std::string::npos) {
        exp10 = std::strtol(s.c_str() + e + 1, nullptr, 10);
        mantissa = s.substr(0, e);
    }
    const std::size_t dot = mantissa.find('.');
    const std::string intPart = mantissa.substr(0, dot);
    const std::string fracPart = dot == std::string::npos ? std::string() : mantissa.substr(dot + 1);

    std::string digits = intPart + fracPart;
    long pointPos = static_cast<long>(intPart.size()) + exp10;
    const std::size_t lead = digits.find_first_not_of('0');
    digits.erase(0, lead);
    pointPos -= static_cast<long>(lead);
    digits.erase(digits.find_last_not_of('0') + 1);

    if (magnitude >= 1e-3 && magnitude < 1e7) {
        if (pointPos <= 0) {
            return "0." + std::string(static_cast<std::size_t>(-pointPos), '0') + digits;
        }
        if (static_cast<std::size_t>(pointPos) >= digits.size()) {
            return digits + std::string(static_cast<std::size_t>(pointPos) - digits.size(), '0') + ".0";
        }
        return digits.substr(0, static_cast<std::size_t>(pointPos)) + "." +
               digits.substr(static_cast<std::size_t>(pointPos));
    }
    const std::string rest = digits.size() > 1 ? digits.substr(1) : std::string("0");
    return digits.substr(0, 1) + "." + rest + "E" + std::to_string(pointPos - 1);
}

std::string doubleToString(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";
    if (v == 0.0) return std::signbit(v) ? "-0.0" : "0.0";
    const std::string magnitude = shortestDecimal(std::fabs(v));
    return v < 0 ? "-" + magnitude : magnitude;
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

// =============================================================================
// Modifier Parsing
// =============================================================================

FormatModifiers FormatModifiers::parse(std::string_view term) {
    FormatModifiers mods;
    std::size_t p = 0;

    // Flags
    while (p < term.size()) {
        bool* flag = nullptr;
        switch (term[p]) {
            case '-': flag = &mods.leftJustify; break;
            case '#': flag = &mods.alternate; break;
            case '+': flag = &mods.plus; break;
            case ' ': flag = &mods.space; break;
            case '0': flag = &mods.zeroPad; break;
            case ',': flag = &mods.group; break;
            case '(': flag = &mods.parentheses; break;
            default: break;
        }
        if (!flag) break;
        if (*flag) {
            reject(fmt::format("duplicate flag '{}' in \"{}\"", term[p], term));
        }
        *flag = true;
        ++p;
    }

    // Width
    const std::size_t widthStart = p;
    while (p < term.size() && isAsciiDigit(term[p])) ++p;
    if (p > widthStart) {
        const std::string digits(term.substr(widthStart, p - widthStart));
        if (digits.size() > 9) reject(fmt::format("width too large in \"{}\"", term));
        mods.width = std::atoi(digits.c_str());
    }

    // Precision
    if (p < term.size() && term[p] == '.') {
        ++p;
        const std::size_t precisionStart = p;
        while (p < term.size() && isAsciiDigit(term[p])) ++p;
        if (p == precisionStart) {
            reject(fmt::format("missing precision digits in \"{}\"", term));
        }
        const std::string digits(term.substr(precisionStart, p - precisionStart));
        if (digits.size() > 9) reject(fmt::format("precision too large in \"{}\"", term));
        mods.precision = std::atoi(digits.c_str());
    }

    if (p != term.size()) {
        reject(fmt::format("unrecognized modifiers \"{}\"", term));
    }
    if ((mods.leftJustify || mods.zeroPad) && !mods.width) {
        reject(fmt::format("flags in \"{}\" require a width", term));
    }
    if (mods.leftJustify && mods.zeroPad) {
        reject("flags '-' and '0' cannot be combined");
    }
    if (mods.plus && mods.space) {
        reject("flags '+' and ' ' cannot be combined");
    }
    return mods;
}

// =============================================================================
// ValueFormatter
// =============================================================================

ValueFormatter::ValueFormatter(std::optional<std::locale> locale)
    : locale_(std::move(locale)),
      decimalPoint_(invariantDecimalPoint),
      groupingSeparator_(invariantGroupingSeparator),
      grouping_(1, static_cast<char>(defaultGroupingSize)) {
    if (locale_) {
        const auto& punct = std::use_facet<std::numpunct<char>>(*locale_);
        decimalPoint_ = punct.decimal_point();
        // Locales without grouping data (such as "C") group like the invariant rendering
        const std::string grouping = punct.grouping();
        if (!grouping.empty() && punct.thousands_sep() != '\0') {
            groupingSeparator_ = punct.thousands_sep();
            grouping_ = grouping;
        }
    }
}

std::string ValueFormatter::format(std::string_view modifierTerm, std::string_view conversionTerm,
                                   const Argument& arg) const {
    if (conversionTerm.empty()) {
        reject("empty conversion");
    }
    const FormatModifiers mods = FormatModifiers::parse(modifierTerm);
    const char conversion = conversionTerm[0];

    try {
        if (conversion == 't' || conversion == 'T') {
            if (conversionTerm.size() != 2) {
                reject(fmt::format("incomplete date/time conversion '{}'", conversionTerm));
            }
            std::string result = formatDateTime(mods, conversionTerm[1], arg);
            return conversion == 'T' ? toUpper(std::move(result)) : result;
        }
        if (conversionTerm.size() != 1) {
            reject(fmt::format("unknown conversion '{}'", conversionTerm));
        }

        switch (conversion) {
            case 'b': return formatBoolean(mods, arg);
            case 'B': return toUpper(formatBoolean(mods, arg));
            case 'h': return formatHash(mods, arg);
            case 'H': return toUpper(formatHash(mods, arg));
            case 's': return formatString(mods, arg);
            case 'S': return toUpper(formatString(mods, arg));
            case 'c': return formatCharacter(mods, arg);
            case 'C': return toUpper(formatCharacter(mods, arg));
            case 'd': return formatDecimal(mods, arg);
            case 'o': return formatUnsignedRadix(mods, 'o', arg);
            case 'x': return formatUnsignedRadix(mods, 'x', arg);
            case 'X': return toUpper(formatUnsignedRadix(mods, 'x', arg));
            case 'e': return formatFloating(mods, 'e', arg);
            case 'E': return toUpper(formatFloating(mods, 'e', arg));
            case 'f': return formatFloating(mods, 'f', arg);
            case 'g': return formatFloating(mods, 'g', arg);
            case 'G': return toUpper(formatFloating(mods, 'g', arg));
            case 'a': return formatFloating(mods, 'a', arg);
            case 'A': return toUpper(formatFloating(mods, 'a', arg));
            default: break;
        }
    } catch (const fmt::format_error& e) {
        reject(fmt::format("'{}' could not be rendered: {}", conversionTerm, e.what()));
    }
    reject(fmt::format("unknown conversion '{}'", conversionTerm));
}

// =============================================================================
// General Conversions
// =============================================================================

std::string ValueFormatter::formatBoolean(const FormatModifiers& mods, const Argument& arg) const {
    checkModifiers(mods, "-", true, "b");
    bool value = !arg.isNull();
    if (const bool* b = arg.get<bool>()) {
        value = *b;
    }
    return justify(truncateCodepoints(value ? "true" : "false", mods.precision), mods);
}

std::string ValueFormatter::formatHash(const FormatModifiers& mods, const Argument& arg) const {
    checkModifiers(mods, "-", true, "h");
    if (arg.isNull()) {
        return justify(truncateCodepoints("null", mods.precision), mods);
    }
    const std::uint64_t h = arg.hash();
    const auto folded = static_cast<std::uint32_t>(h ^ (h >> 32));
    return justify(truncateCodepoints(fmt::format("{:x}", folded), mods.precision), mods);
}

std::string ValueFormatter::formatString(const FormatModifiers& mods, const Argument& arg) const {
    checkModifiers(mods, "-", true, "s");
    std::string s;
    switch (arg.kind()) {
        case Argument::Kind::Null: s = "null"; break;
        case Argument::Kind::Boolean: s = *arg.get<bool>() ? "true" : "false"; break;
        case Argument::Kind::Character: appendUtf8(s, *arg.get<char32_t>()); break;
        case Argument::Kind::Signed: s = fmt::format("{}", *arg.get<std::int64_t>()); break;
        case Argument::Kind::Unsigned: s = fmt::format("{}", *arg.get<std::uint64_t>()); break;
        case Argument::Kind::Floating: s = doubleToString(*arg.get<double>()); break;
        case Argument::Kind::String: s = *arg.get<std::string>(); break;
        case Argument::Kind::Styled: s = arg.get<text::StyledText>()->content(); break;
        case Argument::Kind::Time: s = dateField(*arg.get<DateTime>(), 'c'); break;
    }
    return justify(truncateCodepoints(std::move(s), mods.precision), mods);
}

std::string ValueFormatter::formatCharacter(const FormatModifiers& mods, const Argument& arg) const {
    checkModifiers(mods, "-", false, "c");
    std::uint64_t codepoint = 0;
    switch (arg.kind()) {
        case Argument::Kind::Null:
            return justify("null", mods);
        case Argument::Kind::Character:
            codepoint = *arg.get<char32_t>();
            break;
        case Argument::Kind::Signed: {
            const std::int64_t v = *arg.get<std::int64_t>();
            if (v < 0) reject(fmt::format("{} is not a valid code point", v));
            codepoint = static_cast<std::uint64_t>(v);
            break;
        }
        case Argument::Kind::Unsigned:
            codepoint = *arg.get<std::uint64_t>();
            break;
        default:
            reject(fmt::format("'c' cannot format a {} argument", arg.kindName()));
    }
    if (codepoint > 0x10FFFF || !isValidCodepoint(static_cast<std::uint32_t>(codepoint))) {
        reject(fmt::format("{:#x} is not a valid code point", codepoint));
    }
    std::string s;
    appendUtf8(s, static_cast<std::uint32_t>(codepoint));
    return justify(std::move(s), mods);
}

// =============================================================================
// Integral Conversions
// =============================================================================

std::string ValueFormatter::formatDecimal(const FormatModifiers& mods, const Argument& arg) const {
    checkModifiers(mods, "-+ 0,(", false, "d");
    if (arg.isNull()) {
        return justify("null", mods);
    }

    bool negative = false;
    std::uint64_t magnitude = 0;
    if (const std::int64_t* v = arg.get<std::int64_t>()) {
        negative = *v < 0;
        // Avoid overflow on INT64_MIN
        magnitude = negative ? static_cast<std::uint64_t>(-(*v + 1)) + 1 : static_cast<std::uint64_t>(*v);
    } else if (const std::uint64_t* u = arg.get<std::uint64_t>()) {
        magnitude = *u;
    } else {
        reject(fmt::format("'d' cannot format a {} argument", arg.kindName()));
    }

    std::string digits = fmt::format("{}", magnitude);
    if (mods.group) {
        digits = groupDigits(digits);
    }
    return justify(signAndPad(std::move(digits), negative, mods), mods);
}

std::string ValueFormatter::formatUnsignedRadix(const FormatModifiers& mods, char conversion,
                                                const Argument& arg) const {
    checkModifiers(mods, "-#0", false, std::string_view(&conversion, 1));
    if (arg.isNull()) {
        return justify("null", mods);
    }

    std::uint64_t bits = 0;
    if (const std::int64_t* v = arg.get<std::int64_t>()) {
        // Two's complement at the source width
        bits = static_cast<std::uint64_t>(*v);
        if (arg.bits() < 64) {
            bits &= (std::uint64_t{1} << arg.bits()) - 1;
        }
    } else if (const std::uint64_t* u = arg.get<std::uint64_t>()) {
        bits = *u;
    } else {
        reject(fmt::format("'{}' cannot format a {} argument", conversion, arg.kindName()));
    }

    const std::string digits = conversion == 'o' ? fmt::format("{:o}", bits) : fmt::format("{:x}", bits);
    std::string prefix;
    if (mods.alternate) {
        prefix = conversion == 'o' ? "0" : "0x";
    }
    std::string body = digits;
    if (mods.zeroPad && mods.width) {
        const std::size_t used = prefix.size() + body.size();
        if (used < static_cast<std::size_t>(*mods.width)) {
            body.insert(0, static_cast<std::size_t>(*mods.width) - used, '0');
        }
    }
    return justify(prefix + body, mods);
}

// =============================================================================
// Floating-Point Conversions
// =============================================================================

std::string ValueFormatter::formatFloating(const FormatModifiers& mods, char conversion,
                                           const Argument& arg) const {
    const char* allowed = "-#+ 0(";
    if (conversion == 'f') allowed = "-#+ 0,(";
    if (conversion == 'g') allowed = "-+ 0,(";
    if (conversion == 'a') allowed = "-#+ 0";
    checkModifiers(mods, allowed, true, std::string_view(&conversion, 1));

    if (arg.isNull()) {
        return justify(truncateCodepoints("null", mods.precision), mods);
    }
    const double* value = arg.get<double>();
    if (!value) {
        reject(fmt::format("'{}' cannot format a {} argument", conversion, arg.kindName()));
    }

    const double v = *value;
    if (std::isnan(v)) {
        return justify("NaN", mods);
    }
    const bool negative = std::signbit(v);
    if (std::isinf(v)) {
        std::string s = "Infinity";
        if (negative) {
            s = mods.parentheses ? "(" + s + ")" : "-" + s;
        } else if (mods.plus) {
            s = "+" + s;
        } else if (mods.space) {
            s = " " + s;
        }
        return justify(std::move(s), mods);
    }

    const double magnitude = std::fabs(v);
    const int precision = mods.precision.value_or(6);
    std::string digits;
    bool groupable = false;
    switch (conversion) {
        case 'e':
            digits = mods.alternate ? fmt::sprintf("%#.*e", precision, magnitude)
                                    : fmt::sprintf("%.*e", precision, magnitude);
            break;
        case 'f':
            digits = mods.alternate ? fmt::sprintf("%#.*f", precision, magnitude)
                                    : fmt::sprintf("%.*f", precision, magnitude);
            groupable = true;
            break;
        case 'g': {
            // Precision counts significant digits; the rounded exponent picks the layout.
            // Fixed notation for 1e-4 <= value < 10^precision, keeping trailing zeros.
            const int significant = precision == 0 ? 1 : precision;
            const std::string scientific = fmt::sprintf("%.*e", significant - 1, magnitude);
            const int exponent = std::atoi(scientific.c_str() + scientific.find('e') + 1);
            if (magnitude != 0.0 && (exponent < -4 || exponent >= significant)) {
                digits = scientific;
            } else {
                digits = fmt::sprintf("%.*f", std::max(significant - 1 - exponent, 0), magnitude);
                groupable = true;
            }
            break;
        }
        case 'a':
            digits = mods.precision ? fmt::sprintf("%.*a", precision, magnitude) : fmt::sprintf("%a", magnitude);
            break;
        default:
            reject(fmt::format("unknown floating-point conversion '{}'", conversion));
    }

    // Localize the decimal point and, when requested, group the integer digits
    if (conversion != 'a') {
        std::size_t intEnd = digits.find_first_of(".e");
        if (intEnd == std::string::npos) intEnd = digits.size();
        if (intEnd < digits.size() && digits[intEnd] == '.') {
            digits[intEnd] = decimalPoint_;
        }
        if (mods.group && groupable) {
            digits = groupDigits(std::string_view(digits).substr(0, intEnd)) + digits.substr(intEnd);
        }
    }
    // Hexadecimal digits are zero padded after their "0x" prefix
    const std::size_t zeroOffset = conversion == 'a' ? 2 : 0;
    return justify(signAndPad(std::move(digits), negative, mods, zeroOffset), mods);
}

// =============================================================================
// Date/Time Conversions
// =============================================================================

std::string ValueFormatter::formatDateTime(const FormatModifiers& mods, char field, const Argument& arg) const {
    const char conversion[] = {'t', field, '\0'};
    checkModifiers(mods, "-", false, conversion);
    if (!std::strchr(dateTimeConversions, field)) {
        reject(fmt::format("unknown date/time conversion '{}'", conversion));
    }
    if (arg.isNull()) {
        return justify("null", mods);
    }

    DateTime dt;
    if (const DateTime* t = arg.get<DateTime>()) {
        dt = *t;
    } else if (const std::int64_t* millis = arg.get<std::int64_t>()) {
        dt = DateTime::fromEpochMillis(*millis);
    } else if (const std::uint64_t* umillis = arg.get<std::uint64_t>()) {
        dt = DateTime::fromEpochMillis(static_cast<std::int64_t>(*umillis));
    } else {
        reject(fmt::format("'{}' cannot format a {} argument", conversion, arg.kindName()));
    }
    return justify(dateField(dt, field), mods);
}

std::string ValueFormatter::dateField(const DateTime& dt, char field) const {
    const std::tm& tm = dt.calendar;
    const int year = tm.tm_year + 1900;
    switch (field) {
        case 'H': return fmt::format("{:02}", tm.tm_hour);
        case 'I': return fmt::format("{:02}", tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12);
        case 'k': return fmt::format("{}", tm.tm_hour);
        case 'l': return fmt::format("{}", tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12);
        case 'M': return fmt::format("{:02}", tm.tm_min);
        case 'S': return fmt::format("{:02}", tm.tm_sec);
        case 'L': return fmt::format("{:03}", dt.nanos / 1000000);
        case 'N': return fmt::format("{:09}", dt.nanos);
        case 'p': return toLower(strftimeLocalized(tm, "%p"));
        case 'z': return strftimeLocalized(tm, "%z");
        case 'Z': return strftimeLocalized(tm, "%Z");
        case 's': return fmt::format("{}", floorDiv(dt.epochMillis, 1000));
        case 'Q': return fmt::format("{}", dt.epochMillis);
        case 'B': return strftimeLocalized(tm, "%B");
        case 'b':
        case 'h': return strftimeLocalized(tm, "%b");
        case 'A': return strftimeLocalized(tm, "%A");
        case 'a': return strftimeLocalized(tm, "%a");
        case 'C': return fmt::format("{:02}", year / 100);
        case 'Y': return fmt::format("{:04}", year);
        case 'y': return fmt::format("{:02}", year % 100);
        case 'j': return fmt::format("{:03}", tm.tm_yday + 1);
        case 'm': return fmt::format("{:02}", tm.tm_mon + 1);
        case 'd': return fmt::format("{:02}", tm.tm_mday);
        case 'e': return fmt::format("{}", tm.tm_mday);
        case 'R': return dateField(dt, 'H') + ":" + dateField(dt, 'M');
        case 'T': return dateField(dt, 'H') + ":" + dateField(dt, 'M') + ":" + dateField(dt, 'S');
        case 'r': return dateField(dt, 'I') + ":" + dateField(dt, 'M') + ":" + dateField(dt, 'S') + " " +
                         toUpper(dateField(dt, 'p'));
        case 'D': return dateField(dt, 'm') + "/" + dateField(dt, 'd') + "/" + dateField(dt, 'y');
        case 'F': return dateField(dt, 'Y') + "-" + dateField(dt, 'm') + "-" + dateField(dt, 'd');
        case 'c': return dateField(dt, 'a') + " " + dateField(dt, 'b') + " " + dateField(dt, 'd') + " " +
                         dateField(dt, 'T') + " " + dateField(dt, 'Z') + " " + dateField(dt, 'Y');
        default: break;
    }
    reject(fmt::format("unknown date/time conversion 't{}'", field));
}

std::string ValueFormatter::strftimeLocalized(const std::tm& calendar, const char* pattern) const {
    std::ostringstream out;
    out.imbue(locale_ ? *locale_ : std::locale::classic());
    out << std::put_time(&calendar, pattern);
    return out.str();
}

// =============================================================================
// Helpers
// =============================================================================

std::string ValueFormatter::groupDigits(std::string_view digits) const {
    // grouping_ lists group sizes from the right; the last size repeats
    std::string result;
    std::size_t remaining = digits.size();
    std::size_t groupIndex = 0;
    std::vector<std::string_view> groups;
    while (remaining > 0) {
        const char size = grouping_[std::min(groupIndex, grouping_.size() - 1)];
        if (size <= 0 || static_cast<std::size_t>(size) >= remaining) {
            groups.push_back(digits.substr(0, remaining));
            break;
        }
        remaining -= static_cast<std::size_t>(size);
        groups.push_back(digits.substr(remaining, static_cast<std::size_t>(size)));
        ++groupIndex;
    }
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
        if (!result.empty()) result += groupingSeparator_;
        result.append(it->data(), it->size());
    }
    return result;
}

std::string ValueFormatter::signAndPad(std::string magnitude, bool negative, const FormatModifiers& mods,
                                       std::size_t zeroOffset) const {
    std::string prefix;
    std::string suffix;
    if (negative) {
        if (mods.parentheses) {
            prefix = "(";
            suffix = ")";
        } else {
            prefix = "-";
        }
    } else if (mods.plus) {
        prefix = "+";
    } else if (mods.space) {
        prefix = " ";
    }

    // Zero padding goes between the sign and the digits
    if (mods.zeroPad && mods.width) {
        const std::size_t used = prefix.size() + magnitude.size() + suffix.size();
        if (used < static_cast<std::size_t>(*mods.width)) {
            magnitude.insert(std::min(zeroOffset, magnitude.size()),
                             static_cast<std::size_t>(*mods.width) - used, '0');
        }
    }
    return prefix + magnitude + suffix;
}

std::string ValueFormatter::justify(std::string s, const FormatModifiers& mods) const {
    // Width counts code points, like precision
    const std::size_t length = codepointCount(s);
    if (!mods.width || length >= static_cast<std::size_t>(*mods.width)) {
        return s;
    }
    const std::size_t padding = static_cast<std::size_t>(*mods.width) - length;
    if (mods.leftJustify) {
        return fmt::format("{}{:{}}", s, "", padding);
    }
    return fmt::format("{:{}}{}", "", padding, s);
}

std::string ValueFormatter::toUpper(std::string s) const {
    const auto& ctype = std::use_facet<std::ctype<char>>(locale_ ? *locale_ : std::locale::classic());
    for (char& c : s) {
        if (static_cast<unsigned char>(c) < 0x80) c = ctype.toupper(c);
    }
    return s;
}

std::string ValueFormatter::toLower(std::string s) const {
    const auto& ctype = std::use_facet<std::ctype<char>>(locale_ ? *locale_ : std::locale::classic());
    for (char& c : s) {
        if (static_cast<unsigned char>(c) < 0x80) c = ctype.tolower(c);
    }
    return s;
}

} // namespace spanfmt

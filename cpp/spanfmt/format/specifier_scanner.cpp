#include "spanfmt/format/specifier_scanner.h"
#include "spanfmt/core/string_utils.h"

namespace spanfmt {

namespace {

// Letters, '%' and the punctuation from '[' to '`' end a modifier run
bool isModifierChar(char c) {
    return !isAsciiLetter(c) && c != '%' && (c < '[' || c > '`');
}

// Try to match a specifier whose '%' is at pos.
std::optional<ConversionSpecifier> matchAt(std::string_view text, std::size_t pos) {
    const std::size_t n = text.size();
    std::size_t p = pos + 1;

    // Argument term
    std::size_t argEnd = p;
    while (argEnd < n && isAsciiDigit(text[argEnd])) ++argEnd;
    if (argEnd > p && argEnd < n && text[argEnd] == '$') {
        ++argEnd;
    } else if (p < n && text[p] == '<') {
        argEnd = p + 1;
    } else {
        // No index term; any digits belong to the modifiers
        argEnd = p;
    }
    const std::string_view argTerm = text.substr(p, argEnd - p);
    p = argEnd;

    // Modifier term
    std::size_t modEnd = p;
    while (modEnd < n && isModifierChar(text[modEnd])) ++modEnd;
    const std::string_view modifierTerm = text.substr(p, modEnd - p);
    p = modEnd;

    // Conversion term
    if (p >= n) {
        return std::nullopt;
    }
    std::size_t convLength = 0;
    const char c = text[p];
    if (c == '%') {
        convLength = 1;
    } else if (c == 't' || c == 'T') {
        if (p + 1 < n && isAsciiLetter(text[p + 1])) {
            convLength = 2;
        }
    } else if (isAsciiLetter(c)) {
        convLength = 1;
    }
    if (convLength == 0) {
        return std::nullopt;
    }

    ConversionSpecifier spec;
    spec.start = static_cast<std::uint32_t>(pos);
    spec.end = static_cast<std::uint32_t>(p + convLength);
    spec.argTerm = std::string(argTerm);
    spec.modifierTerm = std::string(modifierTerm);
    spec.conversionTerm = std::string(text.substr(p, convLength));
    return spec;
}

} // namespace

ArgSelector ConversionSpecifier::selector() const {
    if (argTerm.empty()) return ArgSelector::Implicit;
    if (argTerm == "<") return ArgSelector::Relative;
    return ArgSelector::Explicit;
}

std::optional<ConversionSpecifier> findNextSpecifier(std::string_view text, std::uint32_t from) {
    std::size_t pos = from;
    while (pos < text.size()) {
        pos = text.find('%', pos);
        if (pos == std::string_view::npos) {
            break;
        }
        if (auto spec = matchAt(text, pos)) {
            return spec;
        }
        ++pos;
    }
    return std::nullopt;
}

} // namespace spanfmt

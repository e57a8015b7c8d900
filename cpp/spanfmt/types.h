#ifndef SPANFMT_TYPES_H
#define SPANFMT_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by the text buffer and the formatter.

namespace spanfmt {

// Localization defaults (used when formatting without a locale)
static constexpr char invariantDecimalPoint = '.';
static constexpr char invariantGroupingSeparator = ',';
static constexpr std::size_t defaultGroupingSize = 3;

// Second letters accepted after a 't'/'T' date conversion
static constexpr const char* dateTimeConversions = "HIklMSLNpzZsQBbhAaCYyjmdeRTrDFc";

// ============================================================================
// Color
// ============================================================================

// Packed color: 0xRRGGBBAA
using Color = std::uint32_t;

static inline Color packColorRGBA(float r, float g, float b, float a) noexcept {
    const auto clamp = [](float v) -> std::uint32_t {
        if (v < 0.0f) v = 0.0f;
        if (v > 1.0f) v = 1.0f;
        return static_cast<std::uint32_t>(v * 255.0f + 0.5f);
    };
    return (clamp(r) << 24) | (clamp(g) << 16) | (clamp(b) << 8) | clamp(a);
}

// ============================================================================
// Style Types
// ============================================================================

// Text style flags (bitmask)
enum class TextStyleFlags : std::uint8_t {
    None      = 0,
    Bold      = 1 << 0,
    Italic    = 1 << 1,
    Underline = 1 << 2,
    Strike    = 1 << 3,
};

inline TextStyleFlags operator|(TextStyleFlags a, TextStyleFlags b) {
    return static_cast<TextStyleFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline bool hasFlag(TextStyleFlags flags, TextStyleFlags flag) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

enum class StyleKind : std::uint8_t {
    Text          = 1,
    Clickable     = 2,
    ColorOverride = 3,
};

// Whether an attachment grows when text is inserted exactly at its start/end.
enum class BoundaryMode : std::uint8_t {
    ExclusiveExclusive = 0,  // Neither boundary extends
    ExclusiveInclusive = 1,  // Insertion at end extends
    InclusiveExclusive = 2,  // Insertion at start extends
    InclusiveInclusive = 3,  // Both boundaries extend
};

inline bool isStartInclusive(BoundaryMode mode) {
    return mode == BoundaryMode::InclusiveExclusive || mode == BoundaryMode::InclusiveInclusive;
}
inline bool isEndInclusive(BoundaryMode mode) {
    return mode == BoundaryMode::ExclusiveInclusive || mode == BoundaryMode::InclusiveInclusive;
}

// ============================================================================
// Errors
// ============================================================================

enum class FormatError : std::uint32_t {
    Ok = 0,
    MalformedSpecifier = 1,     // Explicit index term is not a positive integer
    IndexOutOfRange = 2,        // Resolved argument index outside the argument list
    UnsupportedConversion = 3,  // Conversion/flags invalid for the argument type
    InvalidRange = 4,           // Buffer offsets outside [0, length] or start > end
};

const char* formatErrorName(FormatError error);

} // namespace spanfmt

#endif // SPANFMT_TYPES_H

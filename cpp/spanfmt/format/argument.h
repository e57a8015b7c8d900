#ifndef SPANFMT_FORMAT_ARGUMENT_H
#define SPANFMT_FORMAT_ARGUMENT_H

#include "spanfmt/text/styled_text.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace spanfmt {

// Calendar time for 't'/'T' conversions.
struct DateTime {
    std::tm calendar{};             // Broken-down local time (tm_gmtoff/tm_zone used for %tz/%tZ)
    std::int64_t epochMillis = 0;   // Milliseconds since the Unix epoch
    std::int32_t nanos = 0;         // Nanoseconds within the second

    static DateTime fromCalendar(const std::tm& calendar, std::int32_t nanos = 0);
    static DateTime fromTimePoint(std::chrono::system_clock::time_point tp);
    static DateTime fromEpochMillis(std::int64_t millis);
};

/**
 * Argument: one value passed to a format call.
 *
 * Converting constructors cover the C++ types callers pass; integers remember
 * their source width so that octal/hex renderings of negative values match
 * that width.
 */
class Argument {
public:
    // Order matches the variant alternatives below
    enum class Kind : std::uint8_t {
        Null = 0,
        Boolean,
        Character,
        Signed,
        Unsigned,
        Floating,
        String,
        Styled,
        Time,
    };

    Argument() : value_(std::monostate{}) {}
    Argument(std::nullptr_t) : value_(std::monostate{}) {}
    Argument(bool v) : value_(v) {}
    Argument(char v) : value_(static_cast<char32_t>(static_cast<unsigned char>(v))) {}
    Argument(char16_t v) : value_(static_cast<char32_t>(v)) {}
    Argument(char32_t v) : value_(v) {}
    Argument(wchar_t v) : value_(static_cast<char32_t>(v)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T> &&
                               !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t>, int> = 0>
    Argument(T v) : value_(static_cast<std::int64_t>(v)), bits_(sizeof(T) * 8) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                               !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
                               !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t> &&
                               !std::is_same_v<T, wchar_t>, int> = 0>
    Argument(T v) : value_(static_cast<std::uint64_t>(v)), bits_(sizeof(T) * 8) {}

    Argument(float v) : value_(static_cast<double>(v)) {}
    Argument(double v) : value_(v) {}
    Argument(const char* v) : value_(std::monostate{}) {
        if (v) value_ = std::string(v);
    }
    Argument(std::string v) : value_(std::move(v)) {}
    Argument(std::string_view v) : value_(std::string(v)) {}
    Argument(text::StyledText v) : value_(std::move(v)) {}
    Argument(const std::tm& v) : value_(DateTime::fromCalendar(v)) {}
    Argument(std::chrono::system_clock::time_point v) : value_(DateTime::fromTimePoint(v)) {}
    Argument(DateTime v) : value_(std::move(v)) {}

    Kind kind() const { return static_cast<Kind>(value_.index()); }
    bool isNull() const { return kind() == Kind::Null; }

    // Bit width of the source integer type (64 for non-integers)
    std::uint8_t bits() const { return bits_; }

    template <typename T>
    const T* get() const { return std::get_if<T>(&value_); }

    // FNV-1a digest of the value, used by the 'h' conversion.
    std::uint64_t hash() const;

    // Short name of the kind for diagnostics
    const char* kindName() const;

private:
    std::variant<std::monostate, bool, char32_t, std::int64_t, std::uint64_t, double,
                 std::string, text::StyledText, DateTime> value_;
    std::uint8_t bits_ = 64;
};

} // namespace spanfmt

#endif // SPANFMT_FORMAT_ARGUMENT_H

#include "spanfmt/format/argument.h"
#include "spanfmt/core/string_utils.h"

namespace spanfmt {

namespace {

std::tm toLocalCalendar(std::time_t t) {
    std::tm calendar{};
#if defined(_WIN32)
    localtime_s(&calendar, &t);
#else
    localtime_r(&t, &calendar);
#endif
    return calendar;
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

// =============================================================================
// DateTime
// =============================================================================

DateTime DateTime::fromCalendar(const std::tm& calendar, std::int32_t nanos) {
    DateTime dt;
    dt.calendar = calendar;
    dt.nanos = nanos;

    // mktime fills in weekday/yearday and the zone fields without moving the wall clock
    std::tm normalized = calendar;
    normalized.tm_isdst = -1;
    const std::time_t t = std::mktime(&normalized);
    if (t != static_cast<std::time_t>(-1)) {
        dt.calendar = normalized;
        dt.epochMillis = static_cast<std::int64_t>(t) * 1000 + nanos / 1000000;
    }
    return dt;
}

DateTime DateTime::fromTimePoint(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const std::int64_t totalNanos = duration_cast<nanoseconds>(tp.time_since_epoch()).count();
    const std::int64_t seconds = floorDiv(totalNanos, 1000000000);

    DateTime dt;
    dt.calendar = toLocalCalendar(static_cast<std::time_t>(seconds));
    dt.nanos = static_cast<std::int32_t>(totalNanos - seconds * 1000000000);
    dt.epochMillis = floorDiv(totalNanos, 1000000);
    return dt;
}

DateTime DateTime::fromEpochMillis(std::int64_t millis) {
    const std::int64_t seconds = floorDiv(millis, 1000);

    DateTime dt;
    dt.calendar = toLocalCalendar(static_cast<std::time_t>(seconds));
    dt.nanos = static_cast<std::int32_t>((millis - seconds * 1000) * 1000000);
    dt.epochMillis = millis;
    return dt;
}

// =============================================================================
// Argument
// =============================================================================

std::uint64_t Argument::hash() const {
    std::uint64_t h = hashU64(kDigestOffset, static_cast<std::uint64_t>(kind()));
    switch (kind()) {
        case Kind::Null:
            break;
        case Kind::Boolean:
            h = hashU64(h, *get<bool>() ? 1u : 0u);
            break;
        case Kind::Character:
            h = hashU64(h, *get<char32_t>());
            break;
        case Kind::Signed:
            h = hashU64(h, static_cast<std::uint64_t>(*get<std::int64_t>()));
            break;
        case Kind::Unsigned:
            h = hashU64(h, *get<std::uint64_t>());
            break;
        case Kind::Floating:
            h = hashF64(h, *get<double>());
            break;
        case Kind::String:
            h = hashString(h, *get<std::string>());
            break;
        case Kind::Styled:
            h = hashString(h, get<text::StyledText>()->content());
            break;
        case Kind::Time:
            h = hashU64(h, static_cast<std::uint64_t>(get<DateTime>()->epochMillis));
            break;
    }
    return h;
}

const char* Argument::kindName() const {
    switch (kind()) {
        case Kind::Null: return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Character: return "character";
        case Kind::Signed: return "signed integer";
        case Kind::Unsigned: return "unsigned integer";
        case Kind::Floating: return "floating point";
        case Kind::String: return "string";
        case Kind::Styled: return "styled text";
        case Kind::Time: return "date-time";
    }
    return "unknown";
}

} // namespace spanfmt

#include "spanfmt/text/styled_text.h"
#include "spanfmt/core/logging.h"
#include "spanfmt/format/format_error.h"
#include <algorithm>
#include <utility>

namespace spanfmt::text {

StyledText::StyledText() = default;
StyledText::StyledText(std::string content) : content_(std::move(content)) {}
StyledText::StyledText(std::string_view content) : content_(content) {}
StyledText::StyledText(const char* content) : content_(content ? content : "") {}

// =============================================================================
// Attachments
// =============================================================================

void StyledText::attach(StylePtr style, std::uint32_t start, std::uint32_t end, BoundaryMode mode) {
    if (!style) {
        throw FormatException(FormatError::InvalidRange, "cannot attach a null style");
    }
    checkRange(start, end, "attach");
    if (start == end && mode == BoundaryMode::ExclusiveExclusive) {
        throw FormatException(FormatError::InvalidRange,
                              "ExclusiveExclusive attachments cannot have zero length");
    }

    // Re-attaching an existing style moves it
    for (StyleAttachment& a : attachments_) {
        if (a.style == style) {
            a.start = start;
            a.end = end;
            a.mode = mode;
            return;
        }
    }
    attachments_.push_back(StyleAttachment{std::move(style), start, end, mode});
}

bool StyledText::detach(const StylePtr& style) {
    auto it = std::find_if(attachments_.begin(), attachments_.end(),
                           [&style](const StyleAttachment& a) { return a.style == style; });
    if (it == attachments_.end()) {
        return false;
    }
    attachments_.erase(it);
    return true;
}

const StyleAttachment* StyledText::find(const StylePtr& style) const {
    for (const StyleAttachment& a : attachments_) {
        if (a.style == style) {
            return &a;
        }
    }
    return nullptr;
}

std::vector<StyleAttachment> StyledText::attachmentsIn(std::uint32_t start, std::uint32_t end) const {
    std::vector<StyleAttachment> result;
    for (const StyleAttachment& a : attachments_) {
        if (a.start > end || a.end < start) {
            continue;
        }
        // Non-empty ranges touching only at a boundary do not overlap
        if (a.start != a.end && start != end && (a.start == end || a.end == start)) {
            continue;
        }
        result.push_back(a);
    }
    return result;
}

std::uint32_t StyledText::nextTransition(std::uint32_t start, std::uint32_t limit) const {
    std::uint32_t next = limit;
    for (const StyleAttachment& a : attachments_) {
        if (a.start > start && a.start < next) next = a.start;
        if (a.end > start && a.end < next) next = a.end;
    }
    return next;
}

// =============================================================================
// Mutation
// =============================================================================

void StyledText::replace(std::uint32_t start, std::uint32_t end, const StyledText& replacement) {
    checkRange(start, end, "replace");

    // Copy first: the replacement may alias this buffer
    const std::string inserted = replacement.content_;
    const std::vector<StyleAttachment> incoming = replacement.attachments_;

    content_.replace(start, end - start, inserted);
    adjustAttachmentsAfterReplace(start, end, static_cast<std::uint32_t>(inserted.size()));

    for (const StyleAttachment& a : incoming) {
        if (find(a.style)) {
            // A style lives on one range only; the first copy keeps it
            SPANFMT_LOG_DEBUG("style already attached, inserting [%u, %u) as plain text",
                              start + a.start, start + a.end);
            continue;
        }
        attachments_.push_back(StyleAttachment{a.style, start + a.start, start + a.end, a.mode});
    }
}

StyledText StyledText::subText(std::uint32_t start, std::uint32_t end) const {
    checkRange(start, end, "subText");

    StyledText result(std::string_view(content_).substr(start, end - start));
    for (const StyleAttachment& a : attachmentsIn(start, end)) {
        const std::uint32_t clippedStart = std::max(a.start, start) - start;
        const std::uint32_t clippedEnd = std::min(a.end, end) - start;
        if (clippedStart == clippedEnd && a.mode == BoundaryMode::ExclusiveExclusive) {
            continue;
        }
        result.attachments_.push_back(StyleAttachment{a.style, clippedStart, clippedEnd, a.mode});
    }
    return result;
}

// =============================================================================
// Private Helpers
// =============================================================================

void StyledText::checkRange(std::uint32_t start, std::uint32_t end, const char* operation) const {
    if (start > end || end > length()) {
        SPANFMT_LOG_WARN("%s: range [%u, %u) outside [0, %u]", operation, start, end, length());
        throw FormatException(FormatError::InvalidRange,
                              std::string(operation) + ": range [" + std::to_string(start) + ", " +
                                  std::to_string(end) + ") outside text of length " +
                                  std::to_string(length()));
    }
}

void StyledText::adjustAttachmentsAfterReplace(std::uint32_t start, std::uint32_t end, std::uint32_t insertLength) {
    // Treated as deleting [start, end) and then inserting insertLength bytes at start.
    // Offsets inside [start, end] collapse to start; the boundary mode then decides
    // whether the offset stays before or moves after the inserted text.
    const std::uint32_t removedLength = end - start;
    const std::uint32_t insertedEnd = start + insertLength;

    auto mapOffset = [&](std::uint32_t offset, bool staysBefore) -> std::uint32_t {
        if (offset < start) {
            // Before the replaced region: unchanged
            return offset;
        }
        if (offset > end) {
            // After the replaced region: shift by the length delta
            return offset - removedLength + insertLength;
        }
        return staysBefore ? start : insertedEnd;
    };

    for (auto it = attachments_.begin(); it != attachments_.end(); ) {
        StyleAttachment& a = *it;
        // An inclusive start extends over inserted text; an exclusive end does not.
        const std::uint32_t newStart = mapOffset(a.start, isStartInclusive(a.mode));
        const std::uint32_t newEnd = mapOffset(a.end, !isEndInclusive(a.mode));

        if (newStart > newEnd ||
            (newStart == newEnd && a.mode == BoundaryMode::ExclusiveExclusive)) {
            // Attachment was entirely within the replaced region: remove it
            it = attachments_.erase(it);
            continue;
        }
        a.start = newStart;
        a.end = newEnd;
        ++it;
    }
}

} // namespace spanfmt::text

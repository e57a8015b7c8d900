#ifndef SPANFMT_TEXT_STYLED_TEXT_H
#define SPANFMT_TEXT_STYLED_TEXT_H

#include "spanfmt/types.h"
#include "spanfmt/text/style.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace spanfmt::text {

// A style attached to the byte range [start, end) of a StyledText.
struct StyleAttachment {
    StylePtr style;
    std::uint32_t start;        // UTF-8 byte offset into content
    std::uint32_t end;          // UTF-8 byte offset, exclusive
    BoundaryMode mode;          // Growth on insertion at the boundaries

    bool operator==(const StyleAttachment& other) const {
        return style == other.style && start == other.start && end == other.end && mode == other.mode;
    }
    bool operator!=(const StyleAttachment& other) const { return !(*this == other); }
};

/**
 * StyledText: UTF-8 content plus an ordered list of style attachments.
 *
 * Responsibilities:
 * - Content storage and splicing (replace, insert, erase, append)
 * - Attachment bookkeeping: every mutation shifts, clips or drops attachments
 *   so that all offsets stay within [0, length()]
 * - Range queries over attachments
 *
 * A style object is held on at most one range. Attaching a style that is
 * already present moves it; splicing in a styled replacement skips the
 * attachments whose style is already present.
 *
 * Non-responsibilities:
 * - Rendering or interpreting styles
 * - Format specifiers (handled by SpanFormatter)
 */
class StyledText {
public:
    StyledText();
    StyledText(std::string content);
    StyledText(std::string_view content);
    StyledText(const char* content);

    // ==========================================================================
    // Content
    // ==========================================================================

    const std::string& content() const { return content_; }
    std::uint32_t length() const { return static_cast<std::uint32_t>(content_.size()); }
    bool empty() const { return content_.empty(); }

    // ==========================================================================
    // Attachments
    // ==========================================================================

    /**
     * Attach a style to [start, end).
     * @param style Style object (must not be null)
     * @param start Start byte offset (inclusive)
     * @param end End byte offset (exclusive)
     * @param mode Boundary behavior on insertion
     * @throws FormatException(InvalidRange) for bad offsets, a null style, or a
     *         zero-length ExclusiveExclusive range
     */
    void attach(StylePtr style, std::uint32_t start, std::uint32_t end,
                BoundaryMode mode = BoundaryMode::ExclusiveExclusive);

    /**
     * Remove the attachment carrying a style.
     * @return True if the style was attached
     */
    bool detach(const StylePtr& style);

    /**
     * Get the attachment for a style object.
     * @return Pointer to the attachment or nullptr if the style is not attached
     */
    const StyleAttachment* find(const StylePtr& style) const;

    /**
     * All attachments in attach order.
     */
    const std::vector<StyleAttachment>& attachments() const { return attachments_; }

    /**
     * Attachments overlapping [start, end). Ranges that merely touch at a
     * boundary do not overlap unless one of them is empty.
     */
    std::vector<StyleAttachment> attachmentsIn(std::uint32_t start, std::uint32_t end) const;

    /**
     * First offset in (start, limit] where an attachment begins or ends.
     * @return limit if no attachment boundary lies in the range
     */
    std::uint32_t nextTransition(std::uint32_t start, std::uint32_t limit) const;

    // ==========================================================================
    // Mutation
    // ==========================================================================

    /**
     * Replace [start, end) with a replacement (plain strings convert implicitly).
     * Attachments of the replacement are copied at start, keeping their
     * relative offsets, except those whose style is already present here.
     * @throws FormatException(InvalidRange) if start > end or end > length()
     */
    void replace(std::uint32_t start, std::uint32_t end, const StyledText& replacement);

    void insert(std::uint32_t offset, const StyledText& text) { replace(offset, offset, text); }
    void erase(std::uint32_t start, std::uint32_t end) { replace(start, end, StyledText()); }
    void append(const StyledText& text) { replace(length(), length(), text); }

    /**
     * Copy of [start, end) with attachments clipped to the range.
     * @throws FormatException(InvalidRange) if start > end or end > length()
     */
    StyledText subText(std::uint32_t start, std::uint32_t end) const;

    bool operator==(const StyledText& other) const {
        return content_ == other.content_ && attachments_ == other.attachments_;
    }
    bool operator!=(const StyledText& other) const { return !(*this == other); }

private:
    std::string content_;
    std::vector<StyleAttachment> attachments_;

    void checkRange(std::uint32_t start, std::uint32_t end, const char* operation) const;

    void adjustAttachmentsAfterReplace(std::uint32_t start, std::uint32_t end, std::uint32_t insertLength);
};

} // namespace spanfmt::text

#endif // SPANFMT_TEXT_STYLED_TEXT_H

#include <gtest/gtest.h>
#include "spanfmt/text/styled_text.h"
#include "spanfmt/format/format_error.h"
#include <memory>

using namespace spanfmt;
using namespace spanfmt::text;

class StyledTextTest : public ::testing::Test {
protected:
    StylePtr bold = std::make_shared<TextStyle>(TextStyleFlags::Bold);
    StylePtr italic = std::make_shared<TextStyle>(TextStyleFlags::Italic);
    StylePtr red = std::make_shared<TextStyle>(TextStyleFlags::None, 0xFF0000FF);

    // Helper to create "Hello World" with bold "Hello" and red "World"
    StyledText createTwoStyleText() {
        StyledText text("Hello World");
        text.attach(bold, 0, 5);
        text.attach(red, 6, 11);
        return text;
    }
};

// =============================================================================
// Content Tests
// =============================================================================

TEST_F(StyledTextTest, CreateFromString) {
    StyledText text("Hello World");
    EXPECT_EQ(text.content(), "Hello World");
    EXPECT_EQ(text.length(), 11u);
    EXPECT_FALSE(text.empty());
    EXPECT_TRUE(text.attachments().empty());
}

TEST_F(StyledTextTest, DefaultIsEmpty) {
    StyledText text;
    EXPECT_TRUE(text.empty());
    EXPECT_EQ(text.length(), 0u);
}

TEST_F(StyledTextTest, InsertContentAtBeginning) {
    StyledText text("World");
    text.insert(0, "Hello ");
    EXPECT_EQ(text.content(), "Hello World");
}

TEST_F(StyledTextTest, InsertContentAtEnd) {
    StyledText text("Hello");
    text.append(" World");
    EXPECT_EQ(text.content(), "Hello World");
}

TEST_F(StyledTextTest, InsertContentInMiddle) {
    StyledText text("HeWorld");
    text.insert(2, "llo ");
    EXPECT_EQ(text.content(), "Hello World");
}

TEST_F(StyledTextTest, DeleteContentFromMiddle) {
    StyledText text("Hello World");
    text.erase(5, 6);
    EXPECT_EQ(text.content(), "HelloWorld");
}

TEST_F(StyledTextTest, DeleteAllContent) {
    StyledText text = createTwoStyleText();
    text.erase(0, text.length());
    EXPECT_EQ(text.content(), "");
    EXPECT_TRUE(text.attachments().empty());
}

TEST_F(StyledTextTest, ReplaceOutOfRangeThrows) {
    StyledText text("Hello");
    try {
        text.replace(3, 9, "x");
        FAIL() << "expected FormatException";
    } catch (const FormatException& e) {
        EXPECT_EQ(e.code(), FormatError::InvalidRange);
    }
    EXPECT_THROW(text.replace(4, 2, "x"), FormatException);
    EXPECT_EQ(text.content(), "Hello");
}

// =============================================================================
// Attachment Tests
// =============================================================================

TEST_F(StyledTextTest, AttachAndFind) {
    StyledText text = createTwoStyleText();

    ASSERT_EQ(text.attachments().size(), 2u);
    const StyleAttachment* a = text.find(bold);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->start, 0u);
    EXPECT_EQ(a->end, 5u);
    EXPECT_EQ(a->mode, BoundaryMode::ExclusiveExclusive);
    EXPECT_EQ(text.find(italic), nullptr);
}

TEST_F(StyledTextTest, ReattachMovesStyle) {
    StyledText text = createTwoStyleText();
    text.attach(bold, 6, 8);

    ASSERT_EQ(text.attachments().size(), 2u);
    const StyleAttachment* a = text.find(bold);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->start, 6u);
    EXPECT_EQ(a->end, 8u);
}

TEST_F(StyledTextTest, Detach) {
    StyledText text = createTwoStyleText();
    EXPECT_TRUE(text.detach(bold));
    EXPECT_FALSE(text.detach(bold));
    EXPECT_EQ(text.attachments().size(), 1u);
}

TEST_F(StyledTextTest, CombinedFlagsOnOneStyle) {
    auto heading = std::make_shared<TextStyle>(TextStyleFlags::Bold | TextStyleFlags::Underline);
    StyledText text("Title");
    text.attach(heading, 0, 5);

    const auto& style = static_cast<const TextStyle&>(*text.find(heading)->style);
    EXPECT_TRUE(style.has(TextStyleFlags::Bold));
    EXPECT_TRUE(style.has(TextStyleFlags::Underline));
    EXPECT_FALSE(style.has(TextStyleFlags::Italic));
    EXPECT_FALSE(style.color().has_value());
}

TEST_F(StyledTextTest, AttachRejectsInvalidRanges) {
    StyledText text("Hello");
    EXPECT_THROW(text.attach(bold, 2, 9), FormatException);
    EXPECT_THROW(text.attach(bold, 3, 2), FormatException);
    EXPECT_THROW(text.attach(nullptr, 0, 2), FormatException);
    // Zero length is only valid for modes that can grow
    EXPECT_THROW(text.attach(bold, 2, 2), FormatException);
    EXPECT_NO_THROW(text.attach(bold, 2, 2, BoundaryMode::InclusiveInclusive));
}

TEST_F(StyledTextTest, AttachmentsInRange) {
    StyledText text = createTwoStyleText();

    auto hits = text.attachmentsIn(3, 8);
    EXPECT_EQ(hits.size(), 2u);

    // Touching at a boundary is not overlapping
    hits = text.attachmentsIn(5, 6);
    EXPECT_TRUE(hits.empty());

    // A point query returns the ranges containing it
    hits = text.attachmentsIn(5, 5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].style, bold);
}

TEST_F(StyledTextTest, NextTransition) {
    StyledText text = createTwoStyleText();
    EXPECT_EQ(text.nextTransition(0, text.length()), 5u);
    EXPECT_EQ(text.nextTransition(5, text.length()), 6u);
    EXPECT_EQ(text.nextTransition(6, text.length()), 11u);
    EXPECT_EQ(text.nextTransition(0, 3), 3u);
}

// =============================================================================
// Splice Tests
// =============================================================================

TEST_F(StyledTextTest, AttachmentsShiftedOnInsertBefore) {
    StyledText text = createTwoStyleText();
    text.insert(0, ">> ");

    EXPECT_EQ(text.content(), ">> Hello World");
    EXPECT_EQ(text.find(bold)->start, 3u);
    EXPECT_EQ(text.find(bold)->end, 8u);
    EXPECT_EQ(text.find(red)->start, 9u);
    EXPECT_EQ(text.find(red)->end, 14u);
}

TEST_F(StyledTextTest, ExclusiveBoundariesDoNotExtend) {
    StyledText text = createTwoStyleText();
    // Insert at the end of "Hello"
    text.insert(5, "XXX");

    EXPECT_EQ(text.content(), "HelloXXX World");
    EXPECT_EQ(text.find(bold)->start, 0u);
    EXPECT_EQ(text.find(bold)->end, 5u);
    EXPECT_EQ(text.find(red)->start, 9u);

    // Insert at the start of "World"
    text.insert(9, "YY");
    EXPECT_EQ(text.find(red)->start, 11u);
    EXPECT_EQ(text.find(red)->end, 16u);
}

TEST_F(StyledTextTest, InclusiveBoundariesExtend) {
    StyledText text("abcdef");
    text.attach(bold, 2, 4, BoundaryMode::InclusiveInclusive);
    text.attach(italic, 2, 4, BoundaryMode::ExclusiveInclusive);

    text.insert(4, "XX");
    EXPECT_EQ(text.find(bold)->end, 6u);
    EXPECT_EQ(text.find(italic)->end, 6u);

    text.insert(2, "Y");
    EXPECT_EQ(text.find(bold)->start, 2u);
    EXPECT_EQ(text.find(bold)->end, 7u);
    EXPECT_EQ(text.find(italic)->start, 3u);
    EXPECT_EQ(text.find(italic)->end, 7u);
}

TEST_F(StyledTextTest, InsertInsideAttachmentGrowsIt) {
    StyledText text = createTwoStyleText();
    text.insert(2, "--");

    EXPECT_EQ(text.content(), "He--llo World");
    EXPECT_EQ(text.find(bold)->start, 0u);
    EXPECT_EQ(text.find(bold)->end, 7u);
}

TEST_F(StyledTextTest, AttachmentInsideReplacedRangeIsDropped) {
    StyledText text = createTwoStyleText();
    text.replace(0, 5, "Howdy");

    EXPECT_EQ(text.content(), "Howdy World");
    EXPECT_EQ(text.find(bold), nullptr);
    ASSERT_NE(text.find(red), nullptr);
    EXPECT_EQ(text.find(red)->start, 6u);
}

TEST_F(StyledTextTest, OverlappingAttachmentsAreClipped) {
    StyledText text("0123456789");
    text.attach(bold, 1, 5);
    text.attach(italic, 6, 9);

    // Replace [4, 7) with a single character
    text.replace(4, 7, "#");

    EXPECT_EQ(text.content(), "0123#789");
    EXPECT_EQ(text.find(bold)->start, 1u);
    EXPECT_EQ(text.find(bold)->end, 4u);
    EXPECT_EQ(text.find(italic)->start, 5u);
    EXPECT_EQ(text.find(italic)->end, 7u);
}

TEST_F(StyledTextTest, SpanningAttachmentStretchesByDelta) {
    StyledText text("0123456789");
    text.attach(bold, 1, 9);
    text.replace(3, 5, "abcdef");

    EXPECT_EQ(text.content(), "012abcdef56789");
    EXPECT_EQ(text.find(bold)->start, 1u);
    EXPECT_EQ(text.find(bold)->end, 13u);
}

TEST_F(StyledTextTest, ReplaceWithStyledTextCopiesAttachments) {
    StyledText text("Click %s now");
    text.attach(red, 0, 5);

    StyledText link("here");
    link.attach(bold, 0, 4);

    text.replace(6, 8, link);

    EXPECT_EQ(text.content(), "Click here now");
    ASSERT_EQ(text.attachments().size(), 2u);
    EXPECT_EQ(text.find(red)->start, 0u);
    EXPECT_EQ(text.find(red)->end, 5u);
    EXPECT_EQ(text.find(bold)->start, 6u);
    EXPECT_EQ(text.find(bold)->end, 10u);

    // The source keeps its own attachment
    EXPECT_EQ(link.find(bold)->start, 0u);
}

TEST_F(StyledTextTest, StyleAlreadyPresentIsNotCopiedAgain) {
    StyledText link("ab");
    link.attach(bold, 0, 2);

    StyledText text("[] []");
    text.replace(1, 1, link);
    text.replace(6, 6, link);

    EXPECT_EQ(text.content(), "[ab] [ab]");
    ASSERT_EQ(text.attachments().size(), 1u);
    EXPECT_EQ(text.find(bold)->start, 1u);
    EXPECT_EQ(text.find(bold)->end, 3u);
}

TEST_F(StyledTextTest, ReplaceWithSelf) {
    StyledText text = createTwoStyleText();
    text.replace(0, 0, text);

    EXPECT_EQ(text.content(), "Hello WorldHello World");
    // Styles already present keep their shifted ranges
    ASSERT_EQ(text.attachments().size(), 2u);
    EXPECT_EQ(text.find(bold)->start, 11u);
    EXPECT_EQ(text.find(red)->start, 17u);
}

TEST_F(StyledTextTest, OffsetsStayInBounds) {
    StyledText text = createTwoStyleText();
    text.attach(italic, 0, 11, BoundaryMode::InclusiveInclusive);

    text.erase(3, 9);
    text.insert(text.length(), "!");
    text.replace(0, 2, "");

    for (const StyleAttachment& a : text.attachments()) {
        EXPECT_LE(a.start, a.end);
        EXPECT_LE(a.end, text.length());
    }
}

TEST_F(StyledTextTest, SubTextClipsAttachments) {
    StyledText text = createTwoStyleText();
    StyledText sub = text.subText(3, 8);

    EXPECT_EQ(sub.content(), "lo Wo");
    ASSERT_EQ(sub.attachments().size(), 2u);
    EXPECT_EQ(sub.find(bold)->start, 0u);
    EXPECT_EQ(sub.find(bold)->end, 2u);
    EXPECT_EQ(sub.find(red)->start, 3u);
    EXPECT_EQ(sub.find(red)->end, 5u);
}

TEST_F(StyledTextTest, Equality) {
    EXPECT_EQ(createTwoStyleText(), createTwoStyleText());
    EXPECT_NE(createTwoStyleText(), StyledText("Hello World"));
    EXPECT_EQ(StyledText("abc"), StyledText(std::string("abc")));
}

#include <gtest/gtest.h>
#include "spanfmt/text/style_helpers.h"
#include "spanfmt/format/span_formatter.h"

using namespace spanfmt;
using namespace spanfmt::text;

namespace {

// Find the first attachment of a given kind
const StyleAttachment* findKind(const StyledText& text, StyleKind kind) {
    for (const StyleAttachment& a : text.attachments()) {
        if (a.style->kind() == kind) {
            return &a;
        }
    }
    return nullptr;
}

} // namespace

TEST(StyleHelpersTest, AttachClickableCoversWholeText) {
    int clicks = 0;
    StyledText link("http://example.com");
    attachClickable(link, 0xFF0000FF, [&clicks] { ++clicks; });

    ASSERT_EQ(link.attachments().size(), 2u);

    const StyleAttachment* clickable = findKind(link, StyleKind::Clickable);
    ASSERT_NE(clickable, nullptr);
    EXPECT_EQ(clickable->start, 0u);
    EXPECT_EQ(clickable->end, link.length());

    const StyleAttachment* color = findKind(link, StyleKind::ColorOverride);
    ASSERT_NE(color, nullptr);
    EXPECT_EQ(color->start, 0u);
    EXPECT_EQ(color->end, link.length());

    const auto& colorStyle = static_cast<const ColorOverrideStyle&>(*color->style);
    EXPECT_EQ(colorStyle.color(), 0xFF0000FFu);
    EXPECT_FALSE(colorStyle.underline());

    static_cast<const ClickableStyle&>(*clickable->style).click();
    EXPECT_EQ(clicks, 1);
}

TEST(StyleHelpersTest, EmptyTextIsUnchanged) {
    StyledText empty;
    attachClickable(empty, 0xFF0000FF, [] {});
    EXPECT_TRUE(empty.attachments().empty());
}

TEST(StyleHelpersTest, ClickableSurvivesFormatting) {
    int clicks = 0;
    StyledText link("here");
    attachClickable(link, packColorRGBA(0.0f, 0.0f, 1.0f, 1.0f), [&clicks] { ++clicks; });

    StyledText message = spanfmt::format(std::nullopt, "Please click %s to continue", link);
    EXPECT_EQ(message.content(), "Please click here to continue");

    const StyleAttachment* clickable = findKind(message, StyleKind::Clickable);
    ASSERT_NE(clickable, nullptr);
    EXPECT_EQ(clickable->start, 13u);
    EXPECT_EQ(clickable->end, 17u);

    const StyleAttachment* color = findKind(message, StyleKind::ColorOverride);
    ASSERT_NE(color, nullptr);
    EXPECT_EQ(static_cast<const ColorOverrideStyle&>(*color->style).color(), 0x0000FFFFu);

    static_cast<const ClickableStyle&>(*clickable->style).click();
    EXPECT_EQ(clicks, 1);
}

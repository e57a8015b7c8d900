#ifndef SPANFMT_TEXT_STYLE_HELPERS_H
#define SPANFMT_TEXT_STYLE_HELPERS_H

#include "spanfmt/types.h"
#include "spanfmt/text/styled_text.h"
#include <functional>

namespace spanfmt::text {

/**
 * Make a whole text behave as a link.
 *
 * Attaches over [0, length()) a ClickableStyle running the action and a
 * ColorOverrideStyle with the color and no underline. Empty text is left
 * unchanged.
 *
 * Typical use: style the argument, then substitute it with "%s".
 *
 *   StyledText link("http://example.com");
 *   attachClickable(link, 0xFF0000FF, [] { openBrowser(); });
 *   StyledText message = spanfmt::format("Please visit %1$s", link);
 */
void attachClickable(StyledText& text, Color color, std::function<void()> action);

} // namespace spanfmt::text

#endif // SPANFMT_TEXT_STYLE_HELPERS_H

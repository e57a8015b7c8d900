#include "spanfmt/text/style_helpers.h"
#include "spanfmt/core/logging.h"
#include <memory>
#include <utility>

namespace spanfmt::text {

void attachClickable(StyledText& text, Color color, std::function<void()> action) {
    if (text.empty()) {
        SPANFMT_LOG_DEBUG("attachClickable: empty text, nothing to attach");
        return;
    }
    text.attach(std::make_shared<ClickableStyle>(std::move(action)), 0, text.length());
    text.attach(std::make_shared<ColorOverrideStyle>(color, false), 0, text.length());
}

} // namespace spanfmt::text

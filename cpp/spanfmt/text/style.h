#ifndef SPANFMT_TEXT_STYLE_H
#define SPANFMT_TEXT_STYLE_H

#include "spanfmt/types.h"
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace spanfmt::text {

/**
 * Style: an out-of-band annotation attached to a range of a StyledText.
 *
 * Styles are immutable and shared by pointer. Identity matters: a StyledText
 * holds a given style object on at most one range.
 */
class Style {
public:
    virtual ~Style() = default;

    virtual StyleKind kind() const = 0;
};

using StylePtr = std::shared_ptr<const Style>;

// Character appearance (bold, italic, ...) with an optional color.
class TextStyle final : public Style {
public:
    explicit TextStyle(TextStyleFlags flags, std::optional<Color> color = std::nullopt)
        : flags_(flags), color_(color) {}

    StyleKind kind() const override { return StyleKind::Text; }

    TextStyleFlags flags() const { return flags_; }
    bool has(TextStyleFlags flag) const { return hasFlag(flags_, flag); }
    std::optional<Color> color() const { return color_; }

private:
    TextStyleFlags flags_;
    std::optional<Color> color_;
};

// Clickable region. Dispatching clicks is up to the host; click() runs the action.
class ClickableStyle final : public Style {
public:
    explicit ClickableStyle(std::function<void()> action) : action_(std::move(action)) {}

    StyleKind kind() const override { return StyleKind::Clickable; }

    void click() const {
        if (action_) {
            action_();
        }
    }

private:
    std::function<void()> action_;
};

// Display override for link-like text: forces a color and the underline state.
class ColorOverrideStyle final : public Style {
public:
    ColorOverrideStyle(Color color, bool underline) : color_(color), underline_(underline) {}

    StyleKind kind() const override { return StyleKind::ColorOverride; }

    Color color() const { return color_; }
    bool underline() const { return underline_; }

private:
    Color color_;
    bool underline_;
};

} // namespace spanfmt::text

#endif // SPANFMT_TEXT_STYLE_H

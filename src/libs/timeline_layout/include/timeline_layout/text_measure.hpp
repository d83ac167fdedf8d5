#pragma once

#include <cstddef>
#include <string>

namespace timeline_layout {

// Label widths come from whichever surface renders them (ImGui font, export font).
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    virtual double text_width(const std::string& text, double font_size) const = 0;
};

// Fixed advance per UTF-8 code point; used for headless export and tests.
class ApproxTextMeasurer : public TextMeasurer {
public:
    explicit ApproxTextMeasurer(double glyph_width_ratio = 0.6) : ratio_(glyph_width_ratio) {}
    double text_width(const std::string& text, double font_size) const override;

private:
    double ratio_;
};

std::size_t utf8_length(const std::string& text);
// First max_chars code points of text.
std::string utf8_prefix(const std::string& text, std::size_t max_chars);

} // namespace timeline_layout

#include <timeline_layout/text_measure.hpp>

namespace timeline_layout {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::size_t utf8_length(const std::string& text) {
    std::size_t n = 0;
    for (unsigned char c : text)
        if (!is_continuation_byte(c)) ++n;
    return n;
}

std::string utf8_prefix(const std::string& text, std::size_t max_chars) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_continuation_byte(static_cast<unsigned char>(text[i]))) continue;
        if (count == max_chars) return text.substr(0, i);
        ++count;
    }
    return text;
}

double ApproxTextMeasurer::text_width(const std::string& text, double font_size) const {
    return static_cast<double>(utf8_length(text)) * font_size * ratio_;
}

} // namespace timeline_layout

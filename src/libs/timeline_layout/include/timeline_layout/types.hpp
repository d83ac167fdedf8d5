#pragma once

#include <string>

namespace timeline_layout {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct Point {
    double x = 0;
    double y = 0;
};

// Shared year window; start < end always holds for resolver output.
struct YearRange {
    double start_year = 0;
    double end_year = 0;

    double span() const { return end_year - start_year; }
};

// The only state the layout engine owns across renders.
// Handlers take it by value and return the updated value.
struct ViewState {
    double scale = 1.0;
    double offset_x = 0.0;
    double pixel_width = 0.0;
    double pixel_height = 0.0;
};

// Result of one placement; x/y are the box center in pixels.
struct PlacedItem {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
    std::string source_id;

    double left() const { return x - width * 0.5; }
    double right() const { return x + width * 0.5; }
    double top() const { return y - height * 0.5; }
    double bottom() const { return y + height * 0.5; }
    Rect rect() const { return { left(), top(), width, height }; }
};

} // namespace timeline_layout

#pragma once

#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/scene.hpp>
#include <timeline_layout/text_measure.hpp>
#include <timeline_layout/types.hpp>
#include <timeline_model/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace timeline_render {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

enum class CommandKind {
    Line,
    FilledRect,
    StrokedRect,
    Text,
    Curve,          // cubic, p0..p3
    FilledTriangle, // p0..p2
    FilledCircle    // center p0, radius
};

enum class TextAlign { Left, Center, Right };

// One painter-agnostic primitive. Coordinates are surface pixels.
// Text is anchored at p0 (horizontally per align) and vertically centered on p0.y.
struct DrawCommand {
    CommandKind kind = CommandKind::Line;
    timeline_layout::Point p0;
    timeline_layout::Point p1;
    timeline_layout::Point p2;
    timeline_layout::Point p3;
    double radius = 0;
    double thickness = 1;
    Color color;
    std::string text;
    double font_size = 12;
    TextAlign align = TextAlign::Left;
    bool bold = false;
};

struct DrawList {
    double width = 0;
    double height = 0;
    Color background{ 255, 255, 255, 255 };
    std::vector<DrawCommand> commands;
};

struct RenderOptions {
    std::string selected_entity_id;
    bool show_relation_labels = true;
    // While an entity is dragged it is drawn at this center instead of its placed one.
    std::string dragged_entity_id;
    std::optional<timeline_layout::Point> drag_position;
};

// render(inputs) -> DrawCommands for the main or combined view.
// Paint order: scale band and grid, lanes, relations, events, entities.
// measurer sizes the lane name badges; nullptr uses the approximate measurer.
DrawList build_draw_commands(const timeline_layout::PlacedScene& scene,
    const RenderOptions& options = {},
    const timeline_layout::LayoutConfig& config = {},
    const timeline_layout::TextMeasurer* measurer = nullptr);

// Overview surface: full range, entity dots and the main view's viewport rectangle.
DrawList build_minimap_commands(const timeline_model::TimelineData& data,
    const timeline_layout::YearRange& range,
    const timeline_layout::ViewState& main_view,
    const timeline_layout::LayoutConfig& config = {});

} // namespace timeline_render

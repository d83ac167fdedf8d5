#include <timeline_render/draw_commands.hpp>
#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/tick_planner.hpp>
#include <timeline_layout/viewport_mapper.hpp>
#include <cmath>
#include <utility>

namespace timeline_render {

namespace {

using timeline_layout::Point;

// Palette.
const Color background_color{ 255, 255, 255, 255 };
const Color scale_band_color{ 243, 244, 246, 255 };
const Color tick_label_color{ 55, 65, 81, 255 };
const Color major_grid_color{ 229, 231, 235, 255 };
const Color minor_grid_color{ 243, 244, 246, 255 };
const Color lane_even_color{ 250, 250, 250, 255 };
const Color lane_odd_color{ 245, 245, 245, 255 };
const Color lane_border_color{ 229, 231, 235, 255 };
const Color badge_color{ 255, 255, 255, 230 };
const Color lane_name_color{ 31, 41, 55, 255 };
const Color axis_color{ 209, 213, 219, 255 };
const Color relation_color{ 100, 100, 100, 128 };
const Color relation_label_color{ 102, 102, 102, 255 };
const Color accent_color{ 139, 69, 19, 255 };
const Color event_label_color{ 75, 85, 99, 255 };
const Color entity_fill{ 255, 255, 255, 255 };
const Color entity_border{ 209, 213, 219, 255 };
const Color entity_text{ 31, 41, 55, 255 };
const Color selected_border{ 107, 52, 16, 255 };
const Color minimap_background{ 250, 250, 248, 255 };
const Color minimap_border{ 224, 224, 224, 255 };
const Color minimap_axis{ 204, 204, 204, 255 };
const Color minimap_label{ 153, 153, 153, 255 };
const Color viewport_stroke{ 2, 132, 199, 255 };
const Color viewport_fill{ 2, 132, 199, 25 };

const double tick_label_y = 28.0;
const double tick_label_font = 12.0;
const double lane_name_font = 13.0;
const double badge_inset = 5.0;
const double badge_height = 22.0;
const double badge_text_padding = 10.0;
const double event_symbol_font = 16.0;
const double event_symbol_dy = 8.0;
const double minimap_font = 8.0;
const double minimap_dot_radius = 2.0;
const double minimap_dot_lift = 10.0;

DrawCommand line(Point a, Point b, Color c, double thickness) {
    DrawCommand cmd;
    cmd.kind = CommandKind::Line;
    cmd.p0 = a;
    cmd.p1 = b;
    cmd.color = c;
    cmd.thickness = thickness;
    return cmd;
}

// p0 = min corner, p1 = max corner.
DrawCommand rect(CommandKind kind, double x, double y, double w, double h, Color c, double thickness = 1.0) {
    DrawCommand cmd;
    cmd.kind = kind;
    cmd.p0 = { x, y };
    cmd.p1 = { x + w, y + h };
    cmd.color = c;
    cmd.thickness = thickness;
    return cmd;
}

DrawCommand text(Point at, std::string s, double font_size, Color c, TextAlign align, bool bold = false) {
    DrawCommand cmd;
    cmd.kind = CommandKind::Text;
    cmd.p0 = at;
    cmd.text = std::move(s);
    cmd.font_size = font_size;
    cmd.color = c;
    cmd.align = align;
    cmd.bold = bold;
    return cmd;
}

} // namespace

DrawList build_draw_commands(const timeline_layout::PlacedScene& scene,
    const RenderOptions& options,
    const timeline_layout::LayoutConfig& config,
    const timeline_layout::TextMeasurer* measurer)
{
    const timeline_layout::ApproxTextMeasurer fallback_measurer;
    const timeline_layout::TextMeasurer& measure = measurer ? *measurer : fallback_measurer;

    DrawList out;
    out.width = scene.view.pixel_width;
    out.height = scene.view.pixel_height;
    out.background = background_color;
    auto& cmds = out.commands;
    const double w = out.width;
    const double h = out.height;
    const double band = config.lanes.top_scale_height;

    cmds.push_back(rect(CommandKind::FilledRect, 0, 0, w, band, scale_band_color));
    for (const auto& lane : scene.lanes) {
        const Color fill = lane.index % 2 == 0 ? lane_even_color : lane_odd_color;
        cmds.push_back(rect(CommandKind::FilledRect, 0, lane.top, w, lane.height, fill));
    }

    // Grid: minor lines first so major lines stay on top.
    for (int pass = 0; pass < 2; ++pass) {
        const bool major_pass = pass == 1;
        for (const auto& t : scene.ticks) {
            if (t.tick.major != major_pass) continue;
            cmds.push_back(line({ t.x, band }, { t.x, h },
                major_pass ? major_grid_color : minor_grid_color, major_pass ? 1.0 : 0.5));
            if (major_pass)
                cmds.push_back(text({ t.x, tick_label_y }, t.label, tick_label_font, tick_label_color, TextAlign::Center));
        }
    }

    for (const auto& lane : scene.lanes) {
        cmds.push_back(line({ 0, lane.bottom() }, { w, lane.bottom() }, lane_border_color, 1.0));
        cmds.push_back(line({ 0, lane.axis_y }, { w, lane.axis_y }, axis_color, 2.0));
        if (!lane.name.empty()) {
            const double badge_w = measure.text_width(lane.name, lane_name_font) + badge_text_padding * 2;
            cmds.push_back(rect(CommandKind::FilledRect, badge_inset, lane.top + badge_inset, badge_w, badge_height, badge_color));
            cmds.push_back(text({ badge_inset + badge_text_padding, lane.top + badge_inset + badge_height / 2 },
                lane.name, lane_name_font, lane_name_color, TextAlign::Left, true));
        }
    }

    for (const auto& r : scene.relations) {
        DrawCommand curve;
        curve.kind = CommandKind::Curve;
        curve.p0 = r.start;
        curve.p1 = r.control1;
        curve.p2 = r.control2;
        curve.p3 = r.end;
        curve.color = relation_color;
        curve.thickness = 1.0;
        cmds.push_back(std::move(curve));

        DrawCommand arrow;
        arrow.kind = CommandKind::FilledTriangle;
        arrow.p0 = r.arrow[0];
        arrow.p1 = r.arrow[1];
        arrow.p2 = r.arrow[2];
        arrow.color = relation_color;
        cmds.push_back(std::move(arrow));

        if (options.show_relation_labels && !r.label.empty())
            cmds.push_back(text(r.label_anchor, r.label, config.event.font_size, relation_label_color, TextAlign::Center));
    }

    for (const auto& ev : scene.events) {
        const auto& it = ev.item;
        cmds.push_back(text({ it.x, it.y + event_symbol_dy }, timeline_model::event_kind_symbol(ev.kind),
            event_symbol_font, accent_color, TextAlign::Center));
        cmds.push_back(text({ it.x, it.y - event_symbol_dy }, ev.label, config.event.font_size,
            event_label_color, TextAlign::Center));
    }

    for (const auto& e : scene.entities) {
        timeline_layout::PlacedItem it = e.item;
        if (options.drag_position && it.source_id == options.dragged_entity_id) {
            it.x = options.drag_position->x;
            it.y = options.drag_position->y;
        }
        const bool selected = it.source_id == options.selected_entity_id;
        cmds.push_back(rect(CommandKind::FilledRect, it.left(), it.top(), it.width, it.height,
            selected ? accent_color : entity_fill));
        cmds.push_back(rect(CommandKind::StrokedRect, it.left(), it.top(), it.width, it.height,
            selected ? selected_border : entity_border, selected ? 2.0 : 1.0));
        cmds.push_back(text({ it.x, it.y }, e.label, config.entity.font_size,
            selected ? entity_fill : entity_text, TextAlign::Center));
    }

    return out;
}

DrawList build_minimap_commands(const timeline_model::TimelineData& data,
    const timeline_layout::YearRange& range,
    const timeline_layout::ViewState& main_view,
    const timeline_layout::LayoutConfig& config)
{
    const auto& mm = config.minimap;
    const timeline_layout::AxisTransform transform(range, main_view, config.axis);
    const timeline_layout::ViewportMapper mapper(transform, mm);

    DrawList out;
    out.width = mm.width;
    out.height = mm.height;
    out.background = minimap_background;
    auto& cmds = out.commands;

    cmds.push_back(rect(CommandKind::StrokedRect, 0, 0, mm.width, mm.height, minimap_border));
    const double mid_y = mm.height / 2;
    cmds.push_back(line({ mm.padding, mid_y }, { mm.width - mm.padding, mid_y }, minimap_axis, 1.0));

    for (const auto& e : data.entities) {
        const auto year = timeline_model::resolve_anchor_year(e.anchor_year, e.birth_year, e.death_year);
        if (!year || !std::isfinite(*year)) continue;
        DrawCommand dot;
        dot.kind = CommandKind::FilledCircle;
        dot.p0 = { mapper.year_to_overview_x(*year), mid_y - minimap_dot_lift };
        dot.radius = minimap_dot_radius;
        dot.color = accent_color;
        cmds.push_back(std::move(dot));
    }

    const double label_y = mm.height - mm.padding - minimap_font / 2;
    const auto& r = transform.range();
    cmds.push_back(text({ mm.padding, label_y }, timeline_layout::format_tick_label(r.start_year),
        minimap_font, minimap_label, TextAlign::Left));
    cmds.push_back(text({ mm.width - mm.padding, label_y }, timeline_layout::format_tick_label(r.end_year),
        minimap_font, minimap_label, TextAlign::Right));

    const timeline_layout::Rect vp = mapper.viewport_rect();
    cmds.push_back(rect(CommandKind::FilledRect, vp.x, vp.y, vp.width, vp.height, viewport_fill));
    cmds.push_back(rect(CommandKind::StrokedRect, vp.x, vp.y, vp.width, vp.height, viewport_stroke, 2.0));
    return out;
}

} // namespace timeline_render

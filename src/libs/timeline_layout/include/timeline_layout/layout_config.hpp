#pragma once

#include <timeline_layout/layout_constants.hpp>

namespace timeline_layout {

// Horizontal mapping shared by every surface so exports and on-screen views agree.
struct AxisGeometry {
    double padding = layout::timeline_padding;
    double content_width_fraction = layout::content_width_fraction;
    double min_scale = layout::min_scale;
    double max_scale = layout::max_scale;
};

struct RangeConfig {
    double default_start_year = layout::default_start_year;
    double default_end_year = layout::default_end_year;
    double min_padding_years = layout::min_range_padding_years;
    double padding_fraction = layout::range_padding_fraction;
    double rounding_years = layout::range_rounding_years;
};

struct TickConfig {
    double min_major_spacing = layout::min_major_tick_spacing;
};

struct PlacementConfig {
    double horizontal_margin_base = layout::horizontal_margin_base;
    double horizontal_margin_min = layout::horizontal_margin_min;
    double vertical_margin_base = layout::vertical_margin_base;
    double vertical_margin_min = layout::vertical_margin_min;
    int max_attempts = layout::max_placement_attempts;
};

// Size and baseline of one kind of label relative to its lane's axis line.
struct ItemStyle {
    double font_size = 12.0;
    double text_padding = 8.0;  // per side
    double height = 24.0;
    double axis_offset = 45.0;  // preferred center is this far above the axis
    double top_inset = 25.0;    // clamp: center never higher than lane top + height/2 + inset
};

struct LaneConfig {
    double top_scale_height = layout::top_scale_height;
    double axis_fraction = layout::lane_axis_fraction;
};

struct RelationConfig {
    double arrow_size = layout::relation_arrow_size;
    double same_lane_dip = layout::relation_same_lane_dip;
    double label_lift = layout::relation_label_lift;
};

struct MinimapConfig {
    double width = layout::minimap_width;
    double height = layout::minimap_height;
    double padding = layout::minimap_padding;
};

struct WheelConfig {
    double pinch_delta_threshold = layout::pinch_delta_threshold;
    double pinch_zoom_sensitivity = layout::pinch_zoom_sensitivity;
    double wheel_zoom_sensitivity = layout::wheel_zoom_sensitivity;
    double pan_multiplier = layout::pan_multiplier;
    double button_zoom_step = layout::button_zoom_step;
};

struct LayoutConfig {
    AxisGeometry axis;
    RangeConfig range;
    TickConfig ticks;
    PlacementConfig placement;
    ItemStyle entity{ layout::entity_font_size, layout::entity_text_padding,
        layout::entity_box_height, layout::entity_axis_offset, layout::entity_top_inset };
    ItemStyle event{ layout::event_font_size, layout::event_text_padding,
        layout::event_item_height, layout::event_axis_offset, layout::event_top_inset };
    int event_label_max_chars = layout::event_label_max_chars;
    int event_label_truncated_chars = layout::event_label_truncated_chars;
    LaneConfig lanes;
    RelationConfig relations;
    MinimapConfig minimap;
    WheelConfig wheel;
    double cull_margin = layout::cull_margin;
    double hit_slop = layout::hit_slop;
};

} // namespace timeline_layout

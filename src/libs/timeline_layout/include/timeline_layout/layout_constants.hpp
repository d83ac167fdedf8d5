#pragma once

namespace timeline_layout {

// Default layout constants shared by every rendering surface (main canvas,
// combined view, export, minimap, year picker). All values are pixels unless noted.
// LayoutConfig starts from these values; a config file may override them.

namespace layout {

constexpr double timeline_padding = 100.0;
// Fraction of the surface width the full year range spans at scale 1.
constexpr double content_width_fraction = 0.8;

constexpr double min_scale = 0.1;
constexpr double max_scale = 50.0;

// Default year window when there is no data to derive one from.
constexpr double default_start_year = -500.0;
constexpr double default_end_year = 2000.0;
constexpr double min_range_padding_years = 50.0;
constexpr double range_padding_fraction = 0.05;
constexpr double range_rounding_years = 10.0;

constexpr double min_major_tick_spacing = 80.0;

constexpr double top_scale_height = 40.0;
constexpr double lane_axis_fraction = 0.6;

constexpr double entity_font_size = 12.0;
constexpr double entity_text_padding = 8.0;
constexpr double entity_box_height = 24.0;
constexpr double entity_axis_offset = 45.0;
constexpr double entity_top_inset = 25.0;

constexpr double event_font_size = 9.0;
constexpr double event_text_padding = 5.0;
constexpr double event_item_height = 30.0;
constexpr double event_axis_offset = 35.0;
constexpr double event_top_inset = 5.0;
constexpr int event_label_max_chars = 18;
constexpr int event_label_truncated_chars = 15;

// Collision margins: h = max(min_h, base_h / scale), v = max(min_v, base_v / sqrt(scale)).
constexpr double horizontal_margin_base = 15.0;
constexpr double horizontal_margin_min = 5.0;
constexpr double vertical_margin_base = 8.0;
constexpr double vertical_margin_min = 4.0;
constexpr int max_placement_attempts = 24;

constexpr double cull_margin = 100.0;
constexpr double hit_slop = 5.0;
constexpr double relation_arrow_size = 5.0;
constexpr double relation_same_lane_dip = 40.0;
constexpr double relation_label_lift = 5.0;

constexpr double minimap_width = 200.0;
constexpr double minimap_height = 80.0;
constexpr double minimap_padding = 4.0;

// Wheel handling: small |deltaY| together with the pinch flag is a trackpad pinch.
constexpr double pinch_delta_threshold = 10.0;
constexpr double pinch_zoom_sensitivity = 0.03;
constexpr double wheel_zoom_sensitivity = 0.001;
constexpr double pan_multiplier = 1.5;
constexpr double button_zoom_step = 1.2;

// Approximate glyph advance as a fraction of the font size (headless measuring).
constexpr double approx_glyph_width_ratio = 0.6;

} // namespace layout
} // namespace timeline_layout

#pragma once

#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/label_placer.hpp>
#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/text_measure.hpp>
#include <timeline_layout/tick_planner.hpp>
#include <timeline_layout/types.hpp>
#include <timeline_model/types.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace timeline_layout {

struct LaneGeometry {
    std::string lane_id;
    std::string name;
    std::size_t index = 0;
    double top = 0;
    double height = 0;
    double axis_y = 0;

    double bottom() const { return top + height; }
};

struct PositionedTick {
    Tick tick;
    double x = 0;
    std::string label; // major ticks only
};

struct PlacedEntity {
    PlacedItem item;
    std::size_t lane_index = 0;
    double year = 0;
    std::string label;
};

struct PlacedEvent {
    PlacedItem item;
    std::size_t lane_index = 0;
    double year = 0;
    std::string label; // possibly truncated
    timeline_model::EventKind kind = timeline_model::EventKind::Other;
};

// Cubic curve from the source item to the target item with an arrowhead at the target.
struct RelationRoute {
    std::string relation_id;
    std::string from_entity_id;
    std::string to_entity_id;
    Point start;
    Point control1;
    Point control2;
    Point end;
    std::array<Point, 3> arrow{}; // tip first
    std::string label;
    Point label_anchor;
    bool same_lane = false;
};

// Output of one placement pass: everything a surface needs to draw or hit-test.
struct PlacedScene {
    YearRange range;
    ViewState view;
    TickPlan tick_plan;
    PlacementMargins margins;
    std::vector<PositionedTick> ticks;
    std::vector<LaneGeometry> lanes;
    std::vector<PlacedEvent> events;
    std::vector<PlacedEntity> entities;
    std::vector<RelationRoute> relations;
    std::size_t exhausted_placements = 0;
    std::size_t skipped_relations = 0;
};

// Vertical geometry of n lanes below the top scale band.
std::vector<LaneGeometry> layout_lanes(const std::vector<timeline_model::Lane>& lanes,
    double pixel_height, const LaneConfig& config = {});

// "A very long event name" -> "A very long eve..." once longer than max_chars.
std::string truncate_label(const std::string& label, int max_chars, int keep_chars);

// Runs range -> transform -> ticks -> placement -> relation routing from scratch.
// window, when set, replaces the resolved range (single-lane view, export of a fixed window).
// With no lanes, one implicit lane holds every entity and event.
PlacedScene build_scene(const timeline_model::TimelineData& data,
    const ViewState& view,
    const LayoutConfig& config,
    const TextMeasurer& measurer,
    const std::optional<YearRange>& window = std::nullopt);

// Same pipeline at scale 1 and offset 0 for a fixed-size static surface.
PlacedScene build_export_scene(const timeline_model::TimelineData& data,
    double pixel_width, double pixel_height,
    const LayoutConfig& config,
    const TextMeasurer& measurer,
    const std::optional<YearRange>& window = std::nullopt);

} // namespace timeline_layout

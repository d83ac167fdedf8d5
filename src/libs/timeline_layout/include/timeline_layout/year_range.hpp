#pragma once

#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/types.hpp>
#include <timeline_model/types.hpp>
#include <vector>

namespace timeline_layout {

// Shared year window across every lane in view: declared lane bounds, entity
// birth/death/anchor years and event years all widen it. Padded by
// max(min_padding, span * fraction) and rounded outward to the rounding step.
// Without any usable year the default window is returned unpadded.
YearRange resolve_year_range(const std::vector<timeline_model::Lane>& lanes,
    const std::vector<timeline_model::PositionedEntity>& entities,
    const std::vector<timeline_model::MarkerEvent>& events,
    const RangeConfig& config = {});

YearRange resolve_year_range(const timeline_model::TimelineData& data, const RangeConfig& config = {});

// Window for a single-lane view: the lane's own declared bounds, defaults for
// missing ends, and the default window if the result would be empty or inverted.
YearRange resolve_lane_window(const timeline_model::Lane& lane, const RangeConfig& config = {});

} // namespace timeline_layout

#pragma once

#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/types.hpp>

namespace timeline_layout {

// Maps between the main view and a miniature overview of the full year range.
// The overview always shows the whole range across its inner width
// (width - 2 * padding); the main view's visible window is drawn as a rectangle.
class ViewportMapper {
public:
    ViewportMapper(const AxisTransform& main_view, const MinimapConfig& overview = {});

    double inner_width() const;
    double year_to_overview_x(double year) const;
    double overview_x_to_year(double x) const;

    // Visible window of the main view in overview pixels, clamped to the overview.
    Rect viewport_rect() const;

    // Main-view offset that centers the year under overview x at the current scale.
    double target_offset_for(double overview_x) const;
    ViewState navigate_to(double overview_x) const;

private:
    AxisTransform main_;
    MinimapConfig overview_;
};

} // namespace timeline_layout

#pragma once

#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/types.hpp>

namespace timeline_layout {

// Year <-> pixel mapping for one surface:
//   x = padding + (year - start) * pixels_per_year * scale + offset_x
// with pixels_per_year = pixel_width * content_width_fraction / span.
// Operations that change the view return a new ViewState; the transform itself
// is an immutable snapshot and can be rebuilt cheaply on every event.
class AxisTransform {
public:
    AxisTransform(const YearRange& range, const ViewState& view, const AxisGeometry& geometry = {});

    const YearRange& range() const { return range_; }
    const ViewState& view() const { return view_; }
    const AxisGeometry& geometry() const { return geometry_; }

    // Width in pixels the whole year range spans at scale 1.
    double content_width() const;
    double pixels_per_year() const;
    double scaled_pixels_per_year() const { return pixels_per_year() * view_.scale; }

    double year_to_x(double year) const;
    double x_to_year(double x) const;

    double visible_start_year() const { return x_to_year(0.0); }
    double visible_end_year() const { return x_to_year(view_.pixel_width); }

    double clamp_scale(double scale) const;

    // Pointer-anchored zoom: the year under px stays under px.
    ViewState zoomed_at(double px, double delta) const;
    ViewState zoomed_to(double px, double new_scale) const;
    ViewState zoomed_at_center(double delta) const;
    // Unbounded horizontal translation.
    ViewState panned(double dx) const;
    ViewState reset() const;
    // Keeps the scale and moves the year to the horizontal center of the surface.
    ViewState centered_on(double year) const;

private:
    YearRange range_;
    ViewState view_;
    AxisGeometry geometry_;
};

// Nearest whole year under x, clamped to the transform's range (year picker).
double snap_year(const AxisTransform& transform, double x);

} // namespace timeline_layout

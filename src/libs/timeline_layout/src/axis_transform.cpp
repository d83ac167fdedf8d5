#include <timeline_layout/axis_transform.hpp>
#include <algorithm>
#include <cmath>

namespace timeline_layout {

AxisTransform::AxisTransform(const YearRange& range, const ViewState& view, const AxisGeometry& geometry)
    : range_(range), view_(view), geometry_(geometry)
{
    if (!(geometry_.min_scale > 0.0)) geometry_.min_scale = layout::min_scale;
    if (!(geometry_.max_scale >= geometry_.min_scale)) geometry_.max_scale = geometry_.min_scale;
    if (!(geometry_.content_width_fraction > 0.0)) geometry_.content_width_fraction = layout::content_width_fraction;
    if (!(range_.start_year < range_.end_year)) range_.end_year = range_.start_year + 1.0;
    if (!std::isfinite(view_.offset_x)) view_.offset_x = 0.0;
    view_.scale = std::isfinite(view_.scale) ? clamp_scale(view_.scale) : 1.0;
}

double AxisTransform::content_width() const {
    // Surfaces narrower than one pixel still get a usable mapping.
    const double width = std::max(1.0, view_.pixel_width);
    return width * geometry_.content_width_fraction;
}

double AxisTransform::pixels_per_year() const {
    return content_width() / range_.span();
}

double AxisTransform::year_to_x(double year) const {
    return geometry_.padding + (year - range_.start_year) * scaled_pixels_per_year() + view_.offset_x;
}

double AxisTransform::x_to_year(double x) const {
    return (x - view_.offset_x - geometry_.padding) / scaled_pixels_per_year() + range_.start_year;
}

double AxisTransform::clamp_scale(double scale) const {
    if (std::isnan(scale)) return view_.scale;
    return std::clamp(scale, geometry_.min_scale, geometry_.max_scale);
}

ViewState AxisTransform::zoomed_at(double px, double delta) const {
    if (!std::isfinite(delta)) return view_;
    return zoomed_to(px, view_.scale * delta);
}

ViewState AxisTransform::zoomed_to(double px, double new_scale) const {
    ViewState next = view_;
    next.scale = clamp_scale(new_scale);
    if (!std::isfinite(px)) return next;
    const double anchor_year = x_to_year(px);
    next.offset_x = px - geometry_.padding - (anchor_year - range_.start_year) * pixels_per_year() * next.scale;
    return next;
}

ViewState AxisTransform::zoomed_at_center(double delta) const {
    return zoomed_at(view_.pixel_width * 0.5, delta);
}

ViewState AxisTransform::panned(double dx) const {
    ViewState next = view_;
    if (std::isfinite(dx)) next.offset_x += dx;
    return next;
}

ViewState AxisTransform::reset() const {
    ViewState next = view_;
    next.scale = 1.0;
    next.offset_x = 0.0;
    return next;
}

ViewState AxisTransform::centered_on(double year) const {
    ViewState next = view_;
    if (!std::isfinite(year)) return next;
    next.offset_x = view_.pixel_width * 0.5 - geometry_.padding
        - (year - range_.start_year) * scaled_pixels_per_year();
    return next;
}

double snap_year(const AxisTransform& transform, double x) {
    const YearRange& r = transform.range();
    const double year = std::round(transform.x_to_year(x));
    if (std::isnan(year)) return r.start_year;
    return std::clamp(year, r.start_year, r.end_year);
}

} // namespace timeline_layout

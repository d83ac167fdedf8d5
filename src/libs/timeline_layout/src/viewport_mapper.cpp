#include <timeline_layout/viewport_mapper.hpp>
#include <algorithm>
#include <cmath>

namespace timeline_layout {

ViewportMapper::ViewportMapper(const AxisTransform& main_view, const MinimapConfig& overview)
    : main_(main_view), overview_(overview)
{
}

double ViewportMapper::inner_width() const {
    return std::max(1.0, overview_.width - overview_.padding * 2);
}

double ViewportMapper::year_to_overview_x(double year) const {
    const YearRange& r = main_.range();
    return overview_.padding + (year - r.start_year) / r.span() * inner_width();
}

double ViewportMapper::overview_x_to_year(double x) const {
    const YearRange& r = main_.range();
    return r.start_year + (x - overview_.padding) / inner_width() * r.span();
}

Rect ViewportMapper::viewport_rect() const {
    const double inner = inner_width();
    const double timeline_width = main_.content_width() * main_.view().scale;
    const double main_width = std::max(0.0, main_.view().pixel_width);

    Rect out;
    out.width = std::min(inner, inner * main_width / timeline_width);
    // Fraction of the range scrolled past the left edge of the main view.
    const double start_fraction =
        (-main_.view().offset_x - main_.geometry().padding) / timeline_width;
    const double x = overview_.padding + start_fraction * inner;
    const double max_x = overview_.width - overview_.padding - out.width;
    out.x = std::clamp(x, overview_.padding, std::max(overview_.padding, max_x));
    out.y = overview_.padding;
    out.height = std::max(0.0, overview_.height - overview_.padding * 2);
    return out;
}

double ViewportMapper::target_offset_for(double overview_x) const {
    double fraction = (overview_x - overview_.padding) / inner_width();
    fraction = std::isfinite(fraction) ? std::clamp(fraction, 0.0, 1.0) : 0.0;
    const double timeline_width = main_.content_width() * main_.view().scale;
    return main_.view().pixel_width * 0.5 - main_.geometry().padding - fraction * timeline_width;
}

ViewState ViewportMapper::navigate_to(double overview_x) const {
    ViewState next = main_.view();
    next.offset_x = target_offset_for(overview_x);
    return next;
}

} // namespace timeline_layout

#include <timeline_layout/year_range.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace timeline_layout {

namespace {

struct Bounds {
    double min_year = std::numeric_limits<double>::infinity();
    double max_year = -std::numeric_limits<double>::infinity();
    bool has_data = false;

    void fold(double year) {
        if (!std::isfinite(year)) return;
        min_year = std::min(min_year, year);
        max_year = std::max(max_year, year);
        has_data = true;
    }

    void fold(const std::optional<double>& year) {
        if (year) fold(*year);
    }
};

YearRange default_window(const RangeConfig& config) {
    YearRange r{ config.default_start_year, config.default_end_year };
    if (!(r.start_year < r.end_year)) {
        r.start_year = layout::default_start_year;
        r.end_year = layout::default_end_year;
    }
    return r;
}

} // namespace

YearRange resolve_year_range(const std::vector<timeline_model::Lane>& lanes,
    const std::vector<timeline_model::PositionedEntity>& entities,
    const std::vector<timeline_model::MarkerEvent>& events,
    const RangeConfig& config)
{
    Bounds b;
    for (const auto& lane : lanes) {
        b.fold(lane.declared_start);
        b.fold(lane.declared_end);
    }
    for (const auto& e : entities) {
        b.fold(e.birth_year);
        b.fold(e.death_year);
        b.fold(e.anchor_year);
    }
    for (const auto& ev : events)
        b.fold(ev.year);

    if (!b.has_data) {
        spdlog::debug("year_range fallback=default start={} end={}",
            config.default_start_year, config.default_end_year);
        return default_window(config);
    }

    const double span = b.max_year - b.min_year;
    const double padding = std::max(std::max(config.min_padding_years, 0.0), span * config.padding_fraction);
    const double step = config.rounding_years > 0 ? config.rounding_years : 1.0;

    YearRange r;
    r.start_year = std::floor((b.min_year - padding) / step) * step;
    r.end_year = std::ceil((b.max_year + padding) / step) * step;
    if (!(r.start_year < r.end_year))
        r.end_year = r.start_year + step;
    return r;
}

YearRange resolve_year_range(const timeline_model::TimelineData& data, const RangeConfig& config) {
    return resolve_year_range(data.lanes, data.entities, data.events, config);
}

YearRange resolve_lane_window(const timeline_model::Lane& lane, const RangeConfig& config) {
    const YearRange fallback = default_window(config);
    YearRange r;
    r.start_year = lane.declared_start && std::isfinite(*lane.declared_start)
        ? *lane.declared_start : fallback.start_year;
    r.end_year = lane.declared_end && std::isfinite(*lane.declared_end)
        ? *lane.declared_end : fallback.end_year;
    if (!(r.start_year < r.end_year)) return fallback;
    return r;
}

} // namespace timeline_layout

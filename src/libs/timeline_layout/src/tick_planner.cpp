#include <timeline_layout/tick_planner.hpp>
#include <cmath>
#include <cstdio>

namespace timeline_layout {

namespace {

const double modulo_epsilon = 1e-3;

} // namespace

TickPlan plan_ticks(double pixels_per_year, double min_spacing_px) {
    TickPlan plan;
    plan.major_interval = major_tick_candidates.back();
    if (pixels_per_year > 0 && std::isfinite(pixels_per_year)) {
        const double min_interval = min_spacing_px / pixels_per_year;
        for (double candidate : major_tick_candidates) {
            if (candidate >= min_interval) {
                plan.major_interval = candidate;
                break;
            }
        }
    }
    plan.minor_interval = plan.major_interval / 4.0;
    return plan;
}

bool is_major_tick(double year, double major_interval) {
    if (!(major_interval > 0)) return false;
    // fmod keeps the sign of year; check both ends of the period.
    const double rem = std::fabs(std::fmod(year, major_interval));
    return rem < modulo_epsilon || std::fabs(rem - major_interval) < modulo_epsilon;
}

std::vector<Tick> generate_ticks(const TickPlan& plan, double from_year, double to_year) {
    std::vector<Tick> ticks;
    const double minor = plan.minor_interval;
    if (!(minor > 0) || !std::isfinite(from_year) || !std::isfinite(to_year) || to_year < from_year)
        return ticks;

    const double first = std::floor(from_year / minor) * minor;
    // Step by index so values do not accumulate rounding error.
    for (std::size_t i = 0; i < max_ticks_per_pass; ++i) {
        const double year = first + static_cast<double>(i) * minor;
        if (year > to_year + minor * 1e-9) break;
        ticks.push_back({ year, is_major_tick(year, plan.major_interval) });
    }
    return ticks;
}

std::string format_tick_label(double year) {
    const double rounded = std::round(year) + 0.0; // no "-0"
    if (std::fabs(year - rounded) < 1e-9) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", rounded);
        return buf;
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.2f", year);
    std::string s = buf;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

} // namespace timeline_layout

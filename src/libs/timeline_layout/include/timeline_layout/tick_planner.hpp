#pragma once

#include <timeline_layout/types.hpp>
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace timeline_layout {

// Ascending "nice" major intervals in years; ticks always land on these.
inline constexpr std::array<double, 15> major_tick_candidates = {
    0.25, 0.5, 1, 2, 5, 10, 20, 25, 50, 100, 200, 250, 500, 1000, 2000
};

// Upper bound on ticks produced by one generate_ticks call.
inline constexpr std::size_t max_ticks_per_pass = 8192;

struct TickPlan {
    double major_interval = 1;
    double minor_interval = 0.25; // always major_interval / 4
};

struct Tick {
    double year = 0;
    bool major = false;
};

// Smallest candidate whose on-screen spacing is at least min_spacing_px at the
// given density (pixels per year, already multiplied by the view scale).
// Falls back to the largest candidate.
TickPlan plan_ticks(double pixels_per_year, double min_spacing_px);

// Minor-stepped ticks from floor(from / minor) * minor through to, each flagged
// major when it is a multiple of the major interval.
std::vector<Tick> generate_ticks(const TickPlan& plan, double from_year, double to_year);

bool is_major_tick(double year, double major_interval);

// "1850" for whole years, "1850.25" / "1850.5" otherwise.
std::string format_tick_label(double year);

} // namespace timeline_layout

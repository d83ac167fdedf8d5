#pragma once

#include <timeline_layout/layout_config.hpp>
#include <timeline_layout/types.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace timeline_layout {

struct LabelCandidate {
    std::string source_id;
    double x = 0;           // fixed, from the axis transform
    double width = 0;
    double height = 0;
    double preferred_y = 0; // center
    // Allowed range for the center y (the enclosing lane).
    double min_y = -1e9;
    double max_y = 1e9;
};

struct PlacementMargins {
    double horizontal = layout::horizontal_margin_min;
    double vertical = layout::vertical_margin_min;
};

// Margins shrink as zoom grows so labels pack tighter while items separate.
PlacementMargins margins_for_scale(double scale, const PlacementConfig& config = {});

// Greedy vertical displacement. Every placed item becomes an obstacle for the
// candidates that follow, so one placer instance is one obstacle set (one lane).
// On a collision the candidate jumps past the conflicting item, alternating
// between an upward and a downward frontier; a frontier that leaves the allowed
// range is abandoned. When attempts run out, the last candidate position is
// accepted (overlap allowed) and counted in exhausted_count().
class LabelPlacer {
public:
    explicit LabelPlacer(const PlacementMargins& margins, int max_attempts = layout::max_placement_attempts);

    // Places candidates in ascending x order (stable for equal x).
    // Returned items are in processing order.
    std::vector<PlacedItem> place(std::vector<LabelCandidate> candidates);
    PlacedItem place_one(const LabelCandidate& candidate);

    void add_obstacle(const PlacedItem& item) { placed_.push_back(item); }
    const std::vector<PlacedItem>& placed() const { return placed_; }
    std::size_t exhausted_count() const { return exhausted_; }
    const PlacementMargins& margins() const { return margins_; }

    bool collides(const PlacedItem& a, const PlacedItem& b) const;

private:
    const PlacedItem* first_conflict(const PlacedItem& probe) const;

    PlacementMargins margins_;
    int max_attempts_;
    std::vector<PlacedItem> placed_;
    std::size_t exhausted_ = 0;
};

// Pairs (i, j), i < j, whose boxes intersect (margins not included).
std::vector<std::pair<std::size_t, std::size_t>> find_overlaps(const std::vector<PlacedItem>& items);

} // namespace timeline_layout

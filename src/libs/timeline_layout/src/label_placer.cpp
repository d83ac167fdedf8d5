#include <timeline_layout/label_placer.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace timeline_layout {

namespace {

enum class Side { None, Up, Down };

} // namespace

PlacementMargins margins_for_scale(double scale, const PlacementConfig& config) {
    const double s = scale > 0 && std::isfinite(scale) ? scale : 1.0;
    PlacementMargins m;
    m.horizontal = std::max(config.horizontal_margin_min, config.horizontal_margin_base / s);
    m.vertical = std::max(config.vertical_margin_min, config.vertical_margin_base / std::sqrt(s));
    return m;
}

LabelPlacer::LabelPlacer(const PlacementMargins& margins, int max_attempts)
    : margins_(margins), max_attempts_(std::max(1, max_attempts))
{
}

bool LabelPlacer::collides(const PlacedItem& a, const PlacedItem& b) const {
    const bool h_overlap = std::abs(a.x - b.x) < (a.width + b.width) / 2 + margins_.horizontal;
    const bool v_overlap = std::abs(a.y - b.y) < (a.height + b.height) / 2 + margins_.vertical;
    return h_overlap && v_overlap;
}

const PlacedItem* LabelPlacer::first_conflict(const PlacedItem& probe) const {
    for (const auto& p : placed_) {
        if (collides(probe, p)) return &p;
    }
    return nullptr;
}

PlacedItem LabelPlacer::place_one(const LabelCandidate& c) {
    const double lo = c.min_y;
    const double hi = std::max(c.min_y, c.max_y);
    const double half_h = c.height / 2;
    const double v = margins_.vertical;

    PlacedItem item;
    item.source_id = c.source_id;
    item.x = c.x;
    item.width = c.width;
    item.height = c.height;
    item.y = std::clamp(c.preferred_y, lo, hi);

    double up_y = item.y;
    double down_y = item.y;
    bool up_open = true;
    bool down_open = true;
    Side side = Side::None;
    int attempts = 0;

    const PlacedItem* hit = first_conflict(item);
    while (hit && attempts < max_attempts_) {
        ++attempts;
        // Land strictly past the margin band; each frontier only moves outward.
        const double eps = 1e-6 * std::max(1.0, std::abs(hit->y));
        const double above = hit->top() - half_h - v - eps;
        const double below = hit->bottom() + half_h + v + eps;
        if (side == Side::None) {
            up_y = std::min(above, up_y - eps);
            down_y = std::max(below, down_y + eps);
        } else if (side == Side::Up) {
            up_y = std::min(above, up_y - eps);
        } else {
            down_y = std::max(below, down_y + eps);
        }
        up_open = up_open && up_y >= lo;
        down_open = down_open && down_y <= hi;
        if (!up_open && !down_open) break;

        Side next = side == Side::Up ? Side::Down : Side::Up;
        if (next == Side::Up && !up_open) next = Side::Down;
        if (next == Side::Down && !down_open) next = Side::Up;
        side = next;
        item.y = side == Side::Up ? up_y : down_y;
        hit = first_conflict(item);
    }

    if (hit) ++exhausted_;
    item.y = std::clamp(item.y, lo, hi);
    placed_.push_back(item);
    return item;
}

std::vector<PlacedItem> LabelPlacer::place(std::vector<LabelCandidate> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const LabelCandidate& a, const LabelCandidate& b) { return a.x < b.x; });
    std::vector<PlacedItem> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates)
        out.push_back(place_one(c));
    return out;
}

std::vector<std::pair<std::size_t, std::size_t>> find_overlaps(const std::vector<PlacedItem>& items) {
    std::vector<std::pair<std::size_t, std::size_t>> out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        for (std::size_t j = i + 1; j < items.size(); ++j) {
            const auto& a = items[i];
            const auto& b = items[j];
            if (a.right() <= b.left() || b.right() <= a.left()) continue;
            if (a.bottom() <= b.top() || b.bottom() <= a.top()) continue;
            out.emplace_back(i, j);
        }
    }
    return out;
}

} // namespace timeline_layout

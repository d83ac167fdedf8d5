#include <timeline_layout/hit_test.hpp>
#include <algorithm>
#include <cmath>

namespace timeline_layout {

namespace {

const int curve_segments = 24;

bool box_contains(const PlacedItem& item, double px, double py, double slop) {
    return px >= item.left() - slop && px <= item.right() + slop &&
           py >= item.top() - slop && py <= item.bottom() + slop;
}

double distance_to_segment(const Point& a, const Point& b, double px, double py) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len2 = dx * dx + dy * dy;
    double t = 0.0;
    if (len2 > 0.0)
        t = std::clamp(((px - a.x) * dx + (py - a.y) * dy) / len2, 0.0, 1.0);
    const double cx = a.x + t * dx;
    const double cy = a.y + t * dy;
    return std::hypot(px - cx, py - cy);
}

bool route_contains(const RelationRoute& r, double px, double py, double slop) {
    Point prev = r.start;
    for (int i = 1; i <= curve_segments; ++i) {
        const double t = static_cast<double>(i) / curve_segments;
        const Point cur = cubic_point(r.start, r.control1, r.control2, r.end, t);
        if (distance_to_segment(prev, cur, px, py) <= slop) return true;
        prev = cur;
    }
    return false;
}

} // namespace

Point cubic_point(const Point& p0, const Point& p1, const Point& p2, const Point& p3, double t) {
    const double u = 1.0 - t;
    const double b0 = u * u * u;
    const double b1 = 3.0 * u * u * t;
    const double b2 = 3.0 * u * t * t;
    const double b3 = t * t * t;
    return { b0 * p0.x + b1 * p1.x + b2 * p2.x + b3 * p3.x,
             b0 * p0.y + b1 * p1.y + b2 * p2.y + b3 * p3.y };
}

std::optional<std::string> hit_test_entity(const PlacedScene& scene, double px, double py, double slop) {
    for (auto it = scene.entities.rbegin(); it != scene.entities.rend(); ++it) {
        if (box_contains(it->item, px, py, slop)) return it->item.source_id;
    }
    return std::nullopt;
}

std::optional<std::string> hit_test_relation(const PlacedScene& scene, double px, double py, double slop) {
    for (auto it = scene.relations.rbegin(); it != scene.relations.rend(); ++it) {
        if (route_contains(*it, px, py, slop)) return it->relation_id;
    }
    return std::nullopt;
}

std::optional<HitResult> hit_test(const PlacedScene& scene, double px, double py, double slop) {
    if (auto id = hit_test_entity(scene, px, py, slop))
        return HitResult{ HitKind::Entity, *id };
    for (auto it = scene.events.rbegin(); it != scene.events.rend(); ++it) {
        if (box_contains(it->item, px, py, slop))
            return HitResult{ HitKind::Event, it->item.source_id };
    }
    if (auto id = hit_test_relation(scene, px, py, slop))
        return HitResult{ HitKind::Relation, *id };
    return std::nullopt;
}

} // namespace timeline_layout

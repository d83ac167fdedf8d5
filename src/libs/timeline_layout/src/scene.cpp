#include <timeline_layout/scene.hpp>
#include <timeline_layout/year_range.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace timeline_layout {

namespace {

struct PendingLabel {
    LabelCandidate candidate;
    std::size_t record_index = 0;
};

LabelCandidate make_candidate(const std::string& id, double x, double text_width,
    const ItemStyle& style, const LaneGeometry& lane)
{
    LabelCandidate c;
    c.source_id = id;
    c.x = x;
    c.width = text_width + style.text_padding * 2;
    c.height = style.height;
    c.preferred_y = lane.axis_y - style.axis_offset;
    c.min_y = lane.top + style.height / 2 + style.top_inset;
    c.max_y = lane.bottom() - style.height / 2;
    return c;
}

bool is_visible_x(double x, double pixel_width, double cull_margin) {
    return std::isfinite(x) && x >= -cull_margin && x <= pixel_width + cull_margin;
}

// Sorted by x, stable for equal x, then placed into the shared obstacle set.
template <typename OnPlaced>
void place_sorted(LabelPlacer& placer, std::vector<PendingLabel>& pending, OnPlaced on_placed) {
    std::stable_sort(pending.begin(), pending.end(),
        [](const PendingLabel& a, const PendingLabel& b) { return a.candidate.x < b.candidate.x; });
    for (const auto& p : pending)
        on_placed(placer.place_one(p.candidate), p.record_index);
}

struct Endpoint {
    PlacedItem item;
    std::size_t lane_index = 0;
};

void route_relation(RelationRoute& route, const Endpoint& from, const Endpoint& to,
    const std::vector<LaneGeometry>& lanes, const RelationConfig& config)
{
    route.same_lane = from.lane_index == to.lane_index;
    route.start = { from.item.x, from.item.bottom() };
    route.end = { to.item.x, to.item.bottom() };
    const double mid_y = route.same_lane
        ? std::max(from.item.y, to.item.y) + config.same_lane_dip
        : (lanes[from.lane_index].axis_y + lanes[to.lane_index].axis_y) * 0.5;
    route.control1 = { from.item.x, mid_y };
    route.control2 = { to.item.x, mid_y };

    // Arrowhead points from the approach side into the target.
    const double a = config.arrow_size;
    const double dir = mid_y >= route.end.y ? 1.0 : -1.0;
    route.arrow[0] = route.end;
    route.arrow[1] = { route.end.x - a, route.end.y + dir * a };
    route.arrow[2] = { route.end.x + a, route.end.y + dir * a };

    route.label_anchor = { (from.item.x + to.item.x) * 0.5, mid_y - config.label_lift };
}

} // namespace

std::vector<LaneGeometry> layout_lanes(const std::vector<timeline_model::Lane>& lanes,
    double pixel_height, const LaneConfig& config)
{
    std::vector<LaneGeometry> out;
    const double available = std::max(0.0, pixel_height - config.top_scale_height);
    if (lanes.empty()) {
        LaneGeometry g;
        g.top = config.top_scale_height;
        g.height = available;
        g.axis_y = g.top + g.height * config.axis_fraction;
        out.push_back(std::move(g));
        return out;
    }

    const double lane_height = available / static_cast<double>(lanes.size());
    for (std::size_t i = 0; i < lanes.size(); ++i) {
        LaneGeometry g;
        g.lane_id = lanes[i].id;
        g.name = lanes[i].name;
        g.index = i;
        g.top = config.top_scale_height + static_cast<double>(i) * lane_height;
        g.height = lane_height;
        g.axis_y = g.top + lane_height * config.axis_fraction;
        out.push_back(std::move(g));
    }
    return out;
}

std::string truncate_label(const std::string& label, int max_chars, int keep_chars) {
    if (max_chars < 0 || utf8_length(label) <= static_cast<std::size_t>(max_chars)) return label;
    return utf8_prefix(label, static_cast<std::size_t>(std::max(0, keep_chars))) + "...";
}

PlacedScene build_scene(const timeline_model::TimelineData& data,
    const ViewState& view,
    const LayoutConfig& config,
    const TextMeasurer& measurer,
    const std::optional<YearRange>& window)
{
    PlacedScene scene;
    scene.range = window ? *window : resolve_year_range(data, config.range);
    const AxisTransform transform(scene.range, view, config.axis);
    scene.range = transform.range();
    scene.view = transform.view();
    const double width = scene.view.pixel_width;

    // Ticks: only the part of the range that is on screen.
    scene.tick_plan = plan_ticks(transform.scaled_pixels_per_year(), config.ticks.min_major_spacing);
    const double tick_from = std::max(scene.range.start_year, transform.visible_start_year());
    const double tick_to = std::min(scene.range.end_year, transform.visible_end_year());
    for (const auto& t : generate_ticks(scene.tick_plan, tick_from, tick_to)) {
        const double x = transform.year_to_x(t.year);
        if (x < 0 || x > width) continue;
        PositionedTick pt;
        pt.tick = t;
        pt.x = x;
        if (t.major) pt.label = format_tick_label(t.year);
        scene.ticks.push_back(std::move(pt));
    }

    scene.lanes = layout_lanes(data.lanes, scene.view.pixel_height, config.lanes);
    const bool implicit_lane = data.lanes.empty();
    std::unordered_map<std::string, std::size_t> lane_index;
    for (const auto& g : scene.lanes)
        lane_index.emplace(g.lane_id, g.index);
    auto find_lane = [&](const std::string& id) -> std::optional<std::size_t> {
        if (implicit_lane) return std::size_t{ 0 };
        auto it = lane_index.find(id);
        if (it == lane_index.end()) return std::nullopt;
        return it->second;
    };

    scene.margins = margins_for_scale(scene.view.scale, config.placement);
    std::vector<LabelPlacer> placers;
    placers.reserve(scene.lanes.size());
    for (std::size_t i = 0; i < scene.lanes.size(); ++i)
        placers.emplace_back(scene.margins, config.placement.max_attempts);

    std::vector<std::vector<PendingLabel>> pending_events(scene.lanes.size());
    for (std::size_t i = 0; i < data.events.size(); ++i) {
        const auto& ev = data.events[i];
        const auto lane = find_lane(ev.lane_id);
        if (!lane || !std::isfinite(ev.year)) continue;
        const double x = transform.year_to_x(ev.year);
        if (!is_visible_x(x, width, config.cull_margin)) continue;
        const std::string label = truncate_label(ev.label, config.event_label_max_chars,
            config.event_label_truncated_chars);
        PendingLabel p;
        p.candidate = make_candidate(ev.id, x, measurer.text_width(label, config.event.font_size),
            config.event, scene.lanes[*lane]);
        p.record_index = i;
        pending_events[*lane].push_back(std::move(p));
    }

    std::vector<std::vector<PendingLabel>> pending_entities(scene.lanes.size());
    for (std::size_t i = 0; i < data.entities.size(); ++i) {
        const auto& e = data.entities[i];
        const auto lane = find_lane(e.lane_id);
        if (!lane || !e.anchor_year || !std::isfinite(*e.anchor_year)) continue;
        const double x = transform.year_to_x(*e.anchor_year);
        if (!is_visible_x(x, width, config.cull_margin)) continue;
        PendingLabel p;
        p.candidate = make_candidate(e.id, x, measurer.text_width(e.label, config.entity.font_size),
            config.entity, scene.lanes[*lane]);
        p.record_index = i;
        pending_entities[*lane].push_back(std::move(p));
    }

    // Events first, then entities, into one obstacle set per lane.
    std::unordered_map<std::string, std::size_t> placed_entity_index;
    for (std::size_t lane = 0; lane < scene.lanes.size(); ++lane) {
        LabelPlacer& placer = placers[lane];
        place_sorted(placer, pending_events[lane], [&](const PlacedItem& item, std::size_t idx) {
            const auto& ev = data.events[idx];
            PlacedEvent pe;
            pe.item = item;
            pe.lane_index = lane;
            pe.year = ev.year;
            pe.label = truncate_label(ev.label, config.event_label_max_chars, config.event_label_truncated_chars);
            pe.kind = ev.kind;
            scene.events.push_back(std::move(pe));
        });
        place_sorted(placer, pending_entities[lane], [&](const PlacedItem& item, std::size_t idx) {
            const auto& e = data.entities[idx];
            PlacedEntity pe;
            pe.item = item;
            pe.lane_index = lane;
            pe.year = *e.anchor_year;
            pe.label = e.label;
            placed_entity_index.emplace(e.id, scene.entities.size());
            scene.entities.push_back(std::move(pe));
        });
        scene.exhausted_placements += placer.exhausted_count();
    }

    std::unordered_map<std::string, const timeline_model::PositionedEntity*> entity_by_id;
    for (const auto& e : data.entities)
        entity_by_id.emplace(e.id, &e);

    // Placed item if laid out, otherwise the undisplaced preferred box (culled entity).
    auto resolve_endpoint = [&](const std::string& id) -> std::optional<Endpoint> {
        auto pit = placed_entity_index.find(id);
        if (pit != placed_entity_index.end()) {
            const auto& pe = scene.entities[pit->second];
            return Endpoint{ pe.item, pe.lane_index };
        }
        auto eit = entity_by_id.find(id);
        if (eit == entity_by_id.end()) return std::nullopt;
        const auto& e = *eit->second;
        const auto lane = find_lane(e.lane_id);
        if (!lane || !e.anchor_year || !std::isfinite(*e.anchor_year)) return std::nullopt;
        const LaneGeometry& g = scene.lanes[*lane];
        Endpoint ep;
        ep.lane_index = *lane;
        ep.item.source_id = e.id;
        ep.item.x = transform.year_to_x(*e.anchor_year);
        ep.item.height = config.entity.height;
        ep.item.width = measurer.text_width(e.label, config.entity.font_size) + config.entity.text_padding * 2;
        ep.item.y = std::clamp(g.axis_y - config.entity.axis_offset,
            g.top + config.entity.height / 2 + config.entity.top_inset,
            std::max(g.top + config.entity.height / 2 + config.entity.top_inset,
                g.bottom() - config.entity.height / 2));
        return ep;
    };

    for (const auto& rel : data.relations) {
        const auto from = resolve_endpoint(rel.from_entity_id);
        const auto to = resolve_endpoint(rel.to_entity_id);
        if (!from || !to) {
            ++scene.skipped_relations;
            continue;
        }
        RelationRoute route;
        route.relation_id = rel.id;
        route.from_entity_id = rel.from_entity_id;
        route.to_entity_id = rel.to_entity_id;
        route.label = rel.label;
        route_relation(route, *from, *to, scene.lanes, config.relations);
        scene.relations.push_back(std::move(route));
    }

    if (scene.exhausted_placements > 0)
        spdlog::debug("placement_exhausted count={} scale={}", scene.exhausted_placements, scene.view.scale);
    if (scene.skipped_relations > 0)
        spdlog::debug("relations_skipped count={}", scene.skipped_relations);

    return scene;
}

PlacedScene build_export_scene(const timeline_model::TimelineData& data,
    double pixel_width, double pixel_height,
    const LayoutConfig& config,
    const TextMeasurer& measurer,
    const std::optional<YearRange>& window)
{
    ViewState view;
    view.scale = 1.0;
    view.offset_x = 0.0;
    view.pixel_width = pixel_width;
    view.pixel_height = pixel_height;
    return build_scene(data, view, config, measurer, window);
}

} // namespace timeline_layout

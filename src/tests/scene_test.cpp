#include <gtest/gtest.h>
#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/hit_test.hpp>
#include <timeline_layout/scene.hpp>
#include <timeline_layout/year_range.hpp>
#include <algorithm>

namespace {

using timeline_model::EventKind;

timeline_model::PositionedEntity entity(const char* id, const char* lane, double year, const char* label) {
    timeline_model::PositionedEntity e;
    e.id = id;
    e.lane_id = lane;
    e.anchor_year = year;
    e.label = label;
    return e;
}

timeline_model::TimelineData two_lane_data() {
    timeline_model::TimelineData d;
    d.lanes.push_back({ "a", "Lane A", 1700.0, 1900.0 });
    d.lanes.push_back({ "b", "Lane B", 1850.0, 1950.0 });
    d.entities.push_back(entity("e1724", "a", 1724, "Kant"));
    d.entities.push_back(entity("e1804", "a", 1804, "Kant (late)"));
    d.entities.push_back(entity("e1770", "a", 1770, "Hegel"));
    d.entities.push_back(entity("e1831", "a", 1831, "Hegel (late)"));
    d.entities.push_back(entity("e1900", "b", 1900, "Husserl"));
    return d;
}

timeline_layout::ViewState view_of(double w, double h) {
    timeline_layout::ViewState v;
    v.pixel_width = w;
    v.pixel_height = h;
    return v;
}

const timeline_layout::PlacedEntity* find_entity(const timeline_layout::PlacedScene& s, const std::string& id) {
    for (const auto& e : s.entities)
        if (e.item.source_id == id) return &e;
    return nullptr;
}

const timeline_layout::ApproxTextMeasurer measurer;

} // namespace

TEST(SceneTest, LanesDivideTheAreaBelowTheScaleBand) {
    const auto lanes = timeline_layout::layout_lanes(two_lane_data().lanes, 600);
    ASSERT_EQ(lanes.size(), 2u);
    EXPECT_DOUBLE_EQ(lanes[0].top, 40);
    EXPECT_DOUBLE_EQ(lanes[0].height, 280);
    EXPECT_DOUBLE_EQ(lanes[0].axis_y, 40 + 280 * 0.6);
    EXPECT_DOUBLE_EQ(lanes[1].top, 320);
    EXPECT_DOUBLE_EQ(lanes[1].bottom(), 600);
}

TEST(SceneTest, TwoLaneScenarioOrdersEntitiesByYear) {
    const auto scene = timeline_layout::build_scene(two_lane_data(), view_of(1200, 600), {}, measurer);
    EXPECT_DOUBLE_EQ(scene.range.start_year, 1650);
    EXPECT_DOUBLE_EQ(scene.range.end_year, 2000);
    ASSERT_EQ(scene.entities.size(), 5u);

    const auto* a = find_entity(scene, "e1724");
    const auto* b = find_entity(scene, "e1770");
    const auto* c = find_entity(scene, "e1804");
    const auto* late = find_entity(scene, "e1900");
    ASSERT_TRUE(a && b && c && late);
    EXPECT_LT(a->item.x, b->item.x);
    EXPECT_LT(b->item.x, c->item.x);
    EXPECT_EQ(a->lane_index, 0u);
    EXPECT_EQ(late->lane_index, 1u);
    EXPECT_GE(late->item.top(), scene.lanes[1].top);
    EXPECT_LE(late->item.bottom(), scene.lanes[1].bottom());
    EXPECT_TRUE(timeline_layout::find_overlaps({ a->item, b->item, c->item }).empty());
}

TEST(SceneTest, LanesDoNotDisplaceEachOther) {
    timeline_model::TimelineData d;
    d.lanes.push_back({ "a", "A", std::nullopt, std::nullopt });
    d.lanes.push_back({ "b", "B", std::nullopt, std::nullopt });
    d.entities.push_back(entity("x", "a", 1800, "Same year"));
    d.entities.push_back(entity("y", "b", 1800, "Same year"));
    const auto scene = timeline_layout::build_scene(d, view_of(1000, 600), {}, measurer);
    ASSERT_EQ(scene.entities.size(), 2u);
    EXPECT_DOUBLE_EQ(find_entity(scene, "x")->item.y, scene.lanes[0].axis_y - 45);
    EXPECT_DOUBLE_EQ(find_entity(scene, "y")->item.y, scene.lanes[1].axis_y - 45);
}

TEST(SceneTest, EventsArePlacedBeforeEntitiesAndTruncated) {
    timeline_model::TimelineData d;
    d.lanes.push_back({ "a", "A", std::nullopt, std::nullopt });
    d.entities.push_back(entity("thinker", "a", 1800, "Thinker"));
    d.events.push_back({ "ev", "a", 1800, "A very long event name here", EventKind::Council });
    const auto scene = timeline_layout::build_scene(d, view_of(1000, 600), {}, measurer);
    ASSERT_EQ(scene.events.size(), 1u);
    ASSERT_EQ(scene.entities.size(), 1u);
    EXPECT_EQ(scene.events[0].label, "A very long eve...");
    EXPECT_EQ(scene.events[0].kind, EventKind::Council);
    EXPECT_DOUBLE_EQ(scene.events[0].item.y, scene.lanes[0].axis_y - 35);
    EXPECT_TRUE(timeline_layout::find_overlaps({ scene.events[0].item, scene.entities[0].item }).empty());
}

TEST(SceneTest, TruncationCountsCodePoints) {
    EXPECT_EQ(timeline_layout::truncate_label("Short", 18, 15), "Short");
    EXPECT_EQ(timeline_layout::truncate_label("exactly eighteen!!", 18, 15), "exactly eighteen!!");
    EXPECT_EQ(timeline_layout::truncate_label("\xC3\xA9\xC3\xA9\xC3\xA9", 2, 1), "\xC3\xA9...");
}

TEST(SceneTest, NoLanesUsesOneImplicitLane) {
    timeline_model::TimelineData d;
    d.entities.push_back(entity("a", "", 1800, "Alpha"));
    d.entities.push_back(entity("b", "whatever", 1810, "Beta"));
    const auto scene = timeline_layout::build_scene(d, view_of(1000, 500), {}, measurer);
    ASSERT_EQ(scene.lanes.size(), 1u);
    EXPECT_EQ(scene.entities.size(), 2u);
}

TEST(SceneTest, UnknownLaneAndMissingYearAreExcluded) {
    auto d = two_lane_data();
    d.entities.push_back(entity("orphan", "zzz", 1800, "Orphan"));
    timeline_model::PositionedEntity undated;
    undated.id = "undated";
    undated.lane_id = "a";
    d.entities.push_back(undated);
    const auto scene = timeline_layout::build_scene(d, view_of(1200, 600), {}, measurer);
    EXPECT_EQ(scene.entities.size(), 5u);
    EXPECT_EQ(find_entity(scene, "orphan"), nullptr);
    EXPECT_EQ(find_entity(scene, "undated"), nullptr);
}

TEST(SceneTest, TicksStayOnScreenAndMajorsAreLabelled) {
    const auto scene = timeline_layout::build_scene(two_lane_data(), view_of(1200, 600), {}, measurer);
    ASSERT_FALSE(scene.ticks.empty());
    bool any_major = false;
    for (const auto& t : scene.ticks) {
        EXPECT_GE(t.x, 0);
        EXPECT_LE(t.x, 1200);
        EXPECT_EQ(t.tick.major, !t.label.empty());
        any_major = any_major || t.tick.major;
    }
    EXPECT_TRUE(any_major);
}

TEST(SceneTest, RelationWithUnknownEndpointIsSkipped) {
    auto d = two_lane_data();
    d.relations.push_back({ "r1", "e1724", "e1900", "influence" });
    d.relations.push_back({ "r2", "e1724", "nobody", "" });
    const auto scene = timeline_layout::build_scene(d, view_of(1200, 600), {}, measurer);
    ASSERT_EQ(scene.relations.size(), 1u);
    EXPECT_EQ(scene.skipped_relations, 1u);

    const auto& r = scene.relations[0];
    EXPECT_FALSE(r.same_lane);
    const double mid = (scene.lanes[0].axis_y + scene.lanes[1].axis_y) / 2;
    EXPECT_DOUBLE_EQ(r.control1.y, mid);
    EXPECT_DOUBLE_EQ(r.control2.y, mid);
    const auto* to = find_entity(scene, "e1900");
    EXPECT_DOUBLE_EQ(r.end.x, to->item.x);
    EXPECT_DOUBLE_EQ(r.end.y, to->item.bottom());
    EXPECT_DOUBLE_EQ(r.arrow[0].x, r.end.x);
    EXPECT_DOUBLE_EQ(r.arrow[0].y, r.end.y);
}

TEST(SceneTest, SameLaneRelationDipsBelowBothEndpoints) {
    auto d = two_lane_data();
    d.relations.push_back({ "r", "e1724", "e1770", "" });
    const auto scene = timeline_layout::build_scene(d, view_of(1200, 600), {}, measurer);
    ASSERT_EQ(scene.relations.size(), 1u);
    const auto& r = scene.relations[0];
    EXPECT_TRUE(r.same_lane);
    const double deepest = std::max(find_entity(scene, "e1724")->item.y, find_entity(scene, "e1770")->item.y);
    EXPECT_DOUBLE_EQ(r.control1.y, deepest + 40);
}

TEST(SceneTest, CulledEntityStillAnchorsRelations) {
    timeline_model::TimelineData d;
    d.lanes.push_back({ "a", "A", std::nullopt, std::nullopt });
    d.entities.push_back(entity("near", "a", 1800, "Near"));
    d.entities.push_back(entity("far", "a", 1950, "Far"));
    d.relations.push_back({ "r", "near", "far", "" });

    auto view = view_of(1200, 600);
    view.scale = 10;
    const auto range = timeline_layout::resolve_year_range(d);
    view = timeline_layout::AxisTransform(range, view).centered_on(1800);

    const auto scene = timeline_layout::build_scene(d, view, {}, measurer);
    ASSERT_EQ(scene.entities.size(), 1u);
    EXPECT_EQ(scene.entities[0].item.source_id, "near");
    ASSERT_EQ(scene.relations.size(), 1u);
    EXPECT_GT(scene.relations[0].end.x, 1200 + 100);
}

TEST(SceneTest, ExportSceneUsesIdentityView) {
    const auto scene = timeline_layout::build_export_scene(two_lane_data(), 1600, 900, {}, measurer);
    EXPECT_DOUBLE_EQ(scene.view.scale, 1);
    EXPECT_DOUBLE_EQ(scene.view.offset_x, 0);
    EXPECT_DOUBLE_EQ(scene.view.pixel_width, 1600);
    EXPECT_EQ(scene.entities.size(), 5u);
}

TEST(SceneTest, WindowOverridesResolvedRange) {
    const auto scene = timeline_layout::build_scene(two_lane_data(), view_of(1200, 600), {}, measurer,
        timeline_layout::YearRange{ 1700, 1900 });
    EXPECT_DOUBLE_EQ(scene.range.start_year, 1700);
    EXPECT_DOUBLE_EQ(scene.range.end_year, 1900);
}

TEST(HitTestTest, EntityBoxesHonourSlop) {
    const auto scene = timeline_layout::build_scene(two_lane_data(), view_of(1200, 600), {}, measurer);
    const auto* e = find_entity(scene, "e1900");
    ASSERT_NE(e, nullptr);
    const auto inside = timeline_layout::hit_test(scene, e->item.x, e->item.y, 5);
    ASSERT_TRUE(inside.has_value());
    EXPECT_EQ(inside->kind, timeline_layout::HitKind::Entity);
    EXPECT_EQ(inside->id, "e1900");

    EXPECT_TRUE(timeline_layout::hit_test_entity(scene, e->item.right() + 4, e->item.y, 5).has_value());
    EXPECT_FALSE(timeline_layout::hit_test_entity(scene, e->item.right() + 6, e->item.y, 5).has_value());
}

TEST(HitTestTest, RelationCurveIsHittable) {
    auto d = two_lane_data();
    d.relations.push_back({ "r1", "e1724", "e1900", "" });
    const auto scene = timeline_layout::build_scene(d, view_of(1200, 600), {}, measurer);
    ASSERT_EQ(scene.relations.size(), 1u);
    const auto& r = scene.relations[0];
    const auto mid = timeline_layout::cubic_point(r.start, r.control1, r.control2, r.end, 0.5);
    const auto hit = timeline_layout::hit_test(scene, mid.x, mid.y + 2, 5);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, timeline_layout::HitKind::Relation);
    EXPECT_EQ(hit->id, "r1");
    EXPECT_FALSE(timeline_layout::hit_test(scene, 5, 5, 5).has_value());
}

TEST(SceneTest, SameYearEntitiesStayApartAcrossZoomLevels) {
    timeline_model::TimelineData d;
    d.lanes.push_back({ "a", "Lane A", 1700.0, 1900.0 });
    d.entities.push_back(entity("p", "a", 1800, "Fichte"));
    d.entities.push_back(entity("q", "a", 1800, "Schelling"));
    d.entities.push_back(entity("r", "a", 1800, "Schleiermacher"));
    const auto range = timeline_layout::resolve_year_range(d);

    for (const double scale : { 0.1, 0.7, 2.5, 13.0, 50.0 }) {
        SCOPED_TRACE(scale);
        auto view = view_of(1200, 600);
        view.scale = scale;
        view = timeline_layout::AxisTransform(range, view).centered_on(1800);
        const auto scene = timeline_layout::build_scene(d, view, {}, measurer);
        ASSERT_EQ(scene.entities.size(), 3u);
        EXPECT_EQ(scene.exhausted_placements, 0u);

        std::vector<timeline_layout::PlacedItem> items;
        for (const auto& e : scene.entities) {
            items.push_back(e.item);
            EXPECT_GE(e.item.y, scene.lanes[0].top);
            EXPECT_LE(e.item.y, scene.lanes[0].bottom());
        }
        EXPECT_TRUE(timeline_layout::find_overlaps(items).empty());
        EXPECT_NE(items[0].y, items[1].y);
        EXPECT_NE(items[1].y, items[2].y);
        EXPECT_NE(items[0].y, items[2].y);
    }
}

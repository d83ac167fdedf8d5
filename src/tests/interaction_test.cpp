#include <gtest/gtest.h>
#include <timeline_layout/axis_transform.hpp>
#include <timeline_layout/interaction.hpp>
#include <cmath>

using timeline_layout::GestureMode;

namespace {

timeline_model::TimelineData single_entity_data() {
    timeline_model::TimelineData d;
    d.lanes.push_back({ "a", "Lane A", std::nullopt, std::nullopt });
    timeline_model::PositionedEntity e;
    e.id = "kant";
    e.lane_id = "a";
    e.label = "Kant";
    e.anchor_year = 1800;
    d.entities.push_back(e);
    return d;
}

timeline_layout::ViewState default_view() {
    timeline_layout::ViewState v;
    v.pixel_width = 1000;
    v.pixel_height = 400;
    return v;
}

} // namespace

TEST(WheelTest, PlainScrollZoomsWithWheelSensitivity) {
    const auto d = timeline_layout::classify_wheel({ 300, 0, 100, false, false });
    EXPECT_EQ(d.action, timeline_layout::WheelAction::Zoom);
    EXPECT_FALSE(d.pinch);
    EXPECT_NEAR(d.zoom_delta, 0.9, 1e-12);
}

TEST(WheelTest, CtrlWithSmallDeltaIsPinchZoom) {
    const auto d = timeline_layout::classify_wheel({ 300, 0, -5, true, false });
    EXPECT_EQ(d.action, timeline_layout::WheelAction::Zoom);
    EXPECT_TRUE(d.pinch);
    EXPECT_NEAR(d.zoom_delta, 1.15, 1e-12);
}

TEST(WheelTest, ModifiedLargeScrollPans) {
    const auto ctrl = timeline_layout::classify_wheel({ 300, 0, 100, true, false });
    EXPECT_EQ(ctrl.action, timeline_layout::WheelAction::Pan);
    EXPECT_DOUBLE_EQ(ctrl.pan_dx, -150);

    const auto meta = timeline_layout::classify_wheel({ 300, 0, 5, false, true });
    EXPECT_EQ(meta.action, timeline_layout::WheelAction::Pan);
    EXPECT_DOUBLE_EQ(meta.pan_dx, -7.5);
}

TEST(WheelTest, ModifiedHorizontalSwipePansByDeltaX) {
    const auto meta = timeline_layout::classify_wheel({ 300, -40, 0, false, true });
    EXPECT_EQ(meta.action, timeline_layout::WheelAction::Pan);
    EXPECT_DOUBLE_EQ(meta.pan_dx, 60);

    const auto ctrl = timeline_layout::classify_wheel({ 300, 20, 100, true, false });
    EXPECT_EQ(ctrl.action, timeline_layout::WheelAction::Pan);
    EXPECT_DOUBLE_EQ(ctrl.pan_dx, -30);
}

TEST(GestureControllerTest, WheelZoomKeepsPointerYear) {
    timeline_layout::GestureController g;
    const timeline_layout::YearRange range{ 1750, 1850 };
    const auto view = default_view();
    const double year = timeline_layout::AxisTransform(range, view).x_to_year(420);
    const auto next = g.wheel(view, range, { 420, 0, -100, false, false });
    EXPECT_EQ(g.mode(), GestureMode::Zooming);
    EXPECT_NEAR(next.scale, 1.1, 1e-12);
    EXPECT_LT(std::abs(timeline_layout::AxisTransform(range, next).year_to_x(year) - 420), 1.0);
}

TEST(GestureControllerTest, DraggingAnEntityReportsRoundedYear) {
    const auto data = single_entity_data();
    const timeline_layout::ApproxTextMeasurer measurer;
    const auto view = default_view();
    const auto scene = timeline_layout::build_scene(data, view, {}, measurer);
    ASSERT_EQ(scene.entities.size(), 1u);
    const auto& item = scene.entities[0].item;
    EXPECT_DOUBLE_EQ(item.x, 500);

    timeline_layout::GestureController g;
    auto v = g.pointer_down(view, scene, item.x, item.y);
    EXPECT_EQ(g.mode(), GestureMode::DraggingEntity);
    EXPECT_EQ(g.dragged_entity_id(), "kant");

    v = g.pointer_move(v, item.x + 80, item.y + 19);
    ASSERT_TRUE(g.drag_position().has_value());
    EXPECT_DOUBLE_EQ(g.drag_position()->x, item.x + 80);
    EXPECT_DOUBLE_EQ(v.offset_x, view.offset_x);

    v = g.pointer_up(v, scene.range, item.x + 80, item.y + 19);
    EXPECT_EQ(g.mode(), GestureMode::Idle);
    const auto result = g.take_completed_drag();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->entity_id, "kant");
    EXPECT_DOUBLE_EQ(result->x, 580);
    EXPECT_DOUBLE_EQ(result->year, 1810);
    EXPECT_FALSE(g.take_completed_drag().has_value());
}

TEST(GestureControllerTest, EmptySpacePans) {
    const auto data = single_entity_data();
    const timeline_layout::ApproxTextMeasurer measurer;
    const auto scene = timeline_layout::build_scene(data, default_view(), {}, measurer);

    timeline_layout::GestureController g;
    auto v = g.pointer_down(default_view(), scene, 100, 380);
    EXPECT_EQ(g.mode(), GestureMode::Panning);
    v = g.pointer_move(v, 160, 380);
    v = g.pointer_move(v, 150, 385);
    EXPECT_DOUBLE_EQ(v.offset_x, 50);
    v = g.pointer_up(v, scene.range, 150, 385);
    EXPECT_EQ(g.mode(), GestureMode::Idle);
    EXPECT_FALSE(g.take_completed_drag().has_value());
}

TEST(GestureControllerTest, LeavingCancelsDragWithoutResult) {
    const auto data = single_entity_data();
    const timeline_layout::ApproxTextMeasurer measurer;
    const auto scene = timeline_layout::build_scene(data, default_view(), {}, measurer);
    const auto& item = scene.entities[0].item;

    timeline_layout::GestureController g;
    auto v = g.pointer_down(default_view(), scene, item.x, item.y);
    v = g.pointer_move(v, item.x + 40, item.y);
    v = g.pointer_leave(v);
    EXPECT_EQ(g.mode(), GestureMode::Idle);
    EXPECT_FALSE(g.drag_position().has_value());
    EXPECT_FALSE(g.take_completed_drag().has_value());
}

TEST(GestureControllerTest, OverviewNavigationOwnsThePointer) {
    timeline_layout::GestureController g;
    const timeline_layout::YearRange range{ 1750, 1850 };
    auto v = g.overview_down(default_view(), range, 100);
    EXPECT_EQ(g.mode(), GestureMode::NavigatingOverview);
    EXPECT_NEAR(timeline_layout::AxisTransform(range, v).year_to_x(1800), 500, 1e-9);

    const auto during = g.wheel(v, range, { 300, 0, -100, false, false });
    EXPECT_DOUBLE_EQ(during.scale, v.scale);

    v = g.overview_move(v, range, 4);
    EXPECT_NEAR(timeline_layout::AxisTransform(range, v).year_to_x(1750), 500, 1e-9);
    g.overview_up();
    EXPECT_EQ(g.mode(), GestureMode::Idle);
}

TEST(GestureControllerTest, ModeNames) {
    EXPECT_STREQ(timeline_layout::gesture_mode_name(GestureMode::Idle), "idle");
    EXPECT_STREQ(timeline_layout::gesture_mode_name(GestureMode::DraggingEntity), "dragging_entity");
}

TEST(GestureControllerTest, TransitionDescriptionNamesBothModes) {
    EXPECT_EQ(timeline_layout::describe_gesture_transition(GestureMode::Idle, GestureMode::Panning),
        "gesture idle -> panning");
    EXPECT_EQ(timeline_layout::describe_gesture_transition(GestureMode::NavigatingOverview, GestureMode::Idle),
        "gesture navigating_overview -> idle");
}

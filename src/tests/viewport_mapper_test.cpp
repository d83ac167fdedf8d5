#include <gtest/gtest.h>
#include <timeline_layout/viewport_mapper.hpp>

namespace {

timeline_layout::AxisTransform main_view(double scale, double offset) {
    timeline_layout::ViewState v;
    v.pixel_width = 1000;
    v.pixel_height = 600;
    v.scale = scale;
    v.offset_x = offset;
    return timeline_layout::AxisTransform({ 1650, 2000 }, v);
}

} // namespace

TEST(ViewportMapperTest, OverviewSpansTheWholeRange) {
    const timeline_layout::ViewportMapper m(main_view(1, 0));
    EXPECT_DOUBLE_EQ(m.inner_width(), 192);
    EXPECT_DOUBLE_EQ(m.year_to_overview_x(1650), 4);
    EXPECT_DOUBLE_EQ(m.year_to_overview_x(2000), 196);
    EXPECT_DOUBLE_EQ(m.overview_x_to_year(100), 1825);
}

TEST(ViewportMapperTest, ViewportWidthIsCappedAtInnerWidth) {
    const timeline_layout::ViewportMapper m(main_view(1, 0));
    const auto r = m.viewport_rect();
    EXPECT_DOUBLE_EQ(r.width, 192);
    EXPECT_DOUBLE_EQ(r.x, 4);
    EXPECT_DOUBLE_EQ(r.y, 4);
    EXPECT_DOUBLE_EQ(r.height, 72);
}

TEST(ViewportMapperTest, ViewportShrinksAndMovesWithZoomAndPan) {
    const timeline_layout::ViewportMapper zoomed(main_view(4, 0));
    EXPECT_DOUBLE_EQ(zoomed.viewport_rect().width, 60);
    EXPECT_DOUBLE_EQ(zoomed.viewport_rect().x, 4);

    const timeline_layout::ViewportMapper panned(main_view(4, -1000));
    EXPECT_DOUBLE_EQ(panned.viewport_rect().x, 58);

    const timeline_layout::ViewportMapper far(main_view(4, -1e7));
    EXPECT_DOUBLE_EQ(far.viewport_rect().x, 200 - 4 - 60);
}

TEST(ViewportMapperTest, ClickCentersTheYearUnderIt) {
    const auto t = main_view(4, 250);
    const timeline_layout::ViewportMapper m(t);
    for (double ox : { 20.0, 100.0, 150.5, 190.0 }) {
        const double year = m.overview_x_to_year(ox);
        const auto next = m.navigate_to(ox);
        EXPECT_DOUBLE_EQ(next.scale, 4);
        const timeline_layout::AxisTransform after(t.range(), next);
        EXPECT_NEAR(after.year_to_x(year), 500, 1e-9) << "ox=" << ox;
    }
}

TEST(ViewportMapperTest, ClicksOutsideTheInnerAreaClampToRangeEnds) {
    const auto t = main_view(2, 0);
    const timeline_layout::ViewportMapper m(t);
    const timeline_layout::AxisTransform left(t.range(), m.navigate_to(-50));
    EXPECT_NEAR(left.year_to_x(1650), 500, 1e-9);
    const timeline_layout::AxisTransform right(t.range(), m.navigate_to(500));
    EXPECT_NEAR(right.year_to_x(2000), 500, 1e-9);
}

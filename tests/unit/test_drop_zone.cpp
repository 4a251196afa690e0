#include <gtest/gtest.h>
#include <panedock/drop_zone.hpp>

using namespace panedock;

namespace
{
const DropZoneParams PANE{0.35f, 40.0f, 140.0f};
const Rect           SQUARE{0.0f, 0.0f, 300.0f, 300.0f};
}  // namespace

// ─── Classification ──────────────────────────────────────────────────────────

TEST(DropZoneClassify, FiveRegionsOfSquare)
{
    EXPECT_EQ(classify({150.0f, 10.0f}, SQUARE, PANE), DropZone::Top);
    EXPECT_EQ(classify({10.0f, 150.0f}, SQUARE, PANE), DropZone::Left);
    EXPECT_EQ(classify({150.0f, 150.0f}, SQUARE, PANE), DropZone::Center);
    EXPECT_EQ(classify({290.0f, 150.0f}, SQUARE, PANE), DropZone::Right);
    EXPECT_EQ(classify({150.0f, 290.0f}, SQUARE, PANE), DropZone::Bottom);
}

TEST(DropZoneClassify, OutsideIsNone)
{
    EXPECT_EQ(classify({-1.0f, 150.0f}, SQUARE, PANE), DropZone::None);
    EXPECT_EQ(classify({150.0f, 300.0f}, SQUARE, PANE), DropZone::None);
    EXPECT_EQ(classify({10.0f, 10.0f}, Rect{}, PANE), DropZone::None);
}

TEST(DropZoneClassify, VerticalBandsWinCorners)
{
    EXPECT_EQ(classify({5.0f, 5.0f}, SQUARE, PANE), DropZone::Top);
    EXPECT_EQ(classify({295.0f, 5.0f}, SQUARE, PANE), DropZone::Top);
    EXPECT_EQ(classify({5.0f, 295.0f}, SQUARE, PANE), DropZone::Bottom);
    EXPECT_EQ(classify({295.0f, 295.0f}, SQUARE, PANE), DropZone::Bottom);
}

TEST(DropZoneClassify, OffsetRect)
{
    Rect r{100.0f, 50.0f, 300.0f, 300.0f};
    EXPECT_EQ(classify({250.0f, 60.0f}, r, PANE), DropZone::Top);
    EXPECT_EQ(classify({250.0f, 200.0f}, r, PANE), DropZone::Center);
    EXPECT_EQ(classify({110.0f, 200.0f}, r, PANE), DropZone::Left);
}

// ─── Band sizing ─────────────────────────────────────────────────────────────

TEST(DropZoneBand, ClampedToMinAndMax)
{
    EdgeBand small = edge_band(Rect{0, 0, 100.0f, 100.0f}, PANE);
    EXPECT_FLOAT_EQ(small.horizontal, 40.0f);

    EdgeBand large = edge_band(Rect{0, 0, 1000.0f, 1000.0f}, PANE);
    EXPECT_FLOAT_EQ(large.horizontal, 140.0f);
    EXPECT_FLOAT_EQ(large.vertical, 140.0f);

    EdgeBand mid = edge_band(SQUARE, PANE);
    EXPECT_FLOAT_EQ(mid.horizontal, 105.0f);
}

TEST(DropZoneBand, NeverMoreThanHalf)
{
    EdgeBand tiny = edge_band(Rect{0, 0, 60.0f, 30.0f}, PANE);
    EXPECT_FLOAT_EQ(tiny.horizontal, 30.0f);
    EXPECT_FLOAT_EQ(tiny.vertical, 15.0f);
}

TEST(DropZoneBand, RootParamsAllowWiderBand)
{
    DropZoneParams root{0.35f, 40.0f, 200.0f};
    EdgeBand       band = edge_band(Rect{0, 0, 1000.0f, 400.0f}, root);
    EXPECT_FLOAT_EQ(band.horizontal, 200.0f);
    EXPECT_FLOAT_EQ(band.vertical, 140.0f);
}

// ─── Highlight rectangles ────────────────────────────────────────────────────

TEST(DropZoneRect, EdgeRects)
{
    Rect r{100.0f, 50.0f, 300.0f, 300.0f};
    EXPECT_EQ(zone_rect(r, DropZone::Left, PANE), (Rect{100.0f, 50.0f, 105.0f, 300.0f}));
    EXPECT_EQ(zone_rect(r, DropZone::Right, PANE), (Rect{295.0f, 50.0f, 105.0f, 300.0f}));
    EXPECT_EQ(zone_rect(r, DropZone::Top, PANE), (Rect{100.0f, 50.0f, 300.0f, 105.0f}));
    EXPECT_EQ(zone_rect(r, DropZone::Bottom, PANE), (Rect{100.0f, 245.0f, 300.0f, 105.0f}));
    EXPECT_EQ(zone_rect(r, DropZone::Center, PANE), r);
    EXPECT_TRUE(zone_rect(r, DropZone::None, PANE).empty());
}

TEST(DropZoneRect, ClassifyAgreesWithRects)
{
    for (DropZone z : {DropZone::Left, DropZone::Right, DropZone::Top, DropZone::Bottom})
    {
        Rect  zr = zone_rect(SQUARE, z, PANE);
        Point mid{zr.x + zr.w * 0.5f, zr.y + zr.h * 0.5f};
        if (z == DropZone::Left || z == DropZone::Right)
            mid.y = 150.0f;
        else
            mid.x = 150.0f;
        EXPECT_EQ(classify(mid, SQUARE, PANE), z) << to_string(z);
    }
}

// ─── String conversions ──────────────────────────────────────────────────────

TEST(DockTypes, ZoneStrings)
{
    EXPECT_STREQ(to_string(DropZone::Left), "left");
    EXPECT_EQ(drop_zone_from_string("bottom"), DropZone::Bottom);
    EXPECT_FALSE(drop_zone_from_string("middle").has_value());
    EXPECT_EQ(orientation_from_string("vertical"), Orientation::Vertical);
    EXPECT_FALSE(orientation_from_string("diagonal").has_value());
}

TEST(DockTypes, ZoneGeometry)
{
    EXPECT_EQ(orientation_for_zone(DropZone::Left), Orientation::Horizontal);
    EXPECT_EQ(orientation_for_zone(DropZone::Bottom), Orientation::Vertical);
    EXPECT_FALSE(orientation_for_zone(DropZone::Center).has_value());
    EXPECT_TRUE(zone_inserts_before(DropZone::Top));
    EXPECT_FALSE(zone_inserts_before(DropZone::Right));
    EXPECT_TRUE(is_edge_zone(DropZone::Bottom));
    EXPECT_FALSE(is_edge_zone(DropZone::Center));
}

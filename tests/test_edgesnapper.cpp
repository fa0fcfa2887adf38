/**
 * @file test_edgesnapper.cpp
 * @brief Unit tests for gradient based edge snapping
 */

#include <gtest/gtest.h>
#include "tools/edgesnapper.h"
#include "testsupport.h"

using testsupport::flatImage;
using testsupport::verticalStepImage;

TEST(EdgeSnapperTest, LumaCacheMatchesImage) {
    QImage rgb(7, 5, QImage::Format_RGB32);
    rgb.fill(qRgb(255, 255, 255));
    rgb.setPixel(3, 2, qRgb(0, 0, 0));

    const LumaCache luma = EdgeSnapper::buildLumaCache(rgb);
    ASSERT_FALSE(luma.isEmpty());
    EXPECT_EQ(luma.width, 7);
    EXPECT_EQ(luma.height, 5);
    EXPECT_EQ(luma.pixels.size(), 35);
    EXPECT_EQ(luma.at(0, 0), 255);
    EXPECT_EQ(luma.at(3, 2), 0);
}

TEST(EdgeSnapperTest, NullImageGivesEmptyCache) {
    EXPECT_TRUE(EdgeSnapper::buildLumaCache(QImage()).isEmpty());
}

TEST(EdgeSnapperTest, RadiusFollowsZoom) {
    EdgeSnapper snapper;
    EXPECT_EQ(snapper.radiusForScale(1.0), 12);
    EXPECT_EQ(snapper.radiusForScale(0.5), 24);
    EXPECT_EQ(snapper.radiusForScale(4.0), 3);
    EXPECT_EQ(snapper.radiusForScale(100.0), 1);
    EXPECT_EQ(snapper.radiusForScale(0.0), 1);
}

TEST(EdgeSnapperTest, FlatImageKeepsPoint) {
    EdgeSnapper snapper;
    const LumaCache luma = EdgeSnapper::buildLumaCache(flatImage(50, 50));

    const SnapResult r = snapper.findSnap(QPointF(20.3, 17.8), 1.0, luma);
    EXPECT_FALSE(r.snapped);
    EXPECT_EQ(r.imagePos, QPointF(20.3, 17.8));
    EXPECT_DOUBLE_EQ(r.score, 0.0);
    EXPECT_DOUBLE_EQ(r.displacement(), 0.0);
}

TEST(EdgeSnapperTest, SnapsOntoStepEdge) {
    EdgeSnapper snapper;
    const LumaCache luma = EdgeSnapper::buildLumaCache(verticalStepImage(50, 50, 25));

    // Radius 3 at scale 4; the first maximum in row-major order is the
    // leftmost edge column on the second row of the circular window
    const SnapResult r = snapper.findSnap(QPointF(22.0, 20.0), 4.0, luma);
    ASSERT_TRUE(r.snapped);
    EXPECT_EQ(r.imagePos, QPointF(24.0, 18.0));
    EXPECT_DOUBLE_EQ(r.score, 255.0);
    EXPECT_GT(r.displacement(), 0.1);
}

TEST(EdgeSnapperTest, EdgeOutsideRadiusIsIgnored) {
    EdgeSnapper snapper;
    const LumaCache luma = EdgeSnapper::buildLumaCache(verticalStepImage(50, 50, 25));

    const SnapResult r = snapper.findSnap(QPointF(5.0, 20.0), 4.0, luma);
    EXPECT_FALSE(r.snapped);
    EXPECT_EQ(r.imagePos, QPointF(5.0, 20.0));
}

TEST(EdgeSnapperTest, WeakEdgeBelowMinimumScore) {
    EdgeSnapper snapper;
    const LumaCache luma = EdgeSnapper::buildLumaCache(verticalStepImage(50, 50, 25, 100, 110));

    const SnapResult r = snapper.findSnap(QPointF(24.0, 20.0), 1.0, luma);
    EXPECT_FALSE(r.snapped);
    EXPECT_DOUBLE_EQ(r.score, 10.0);
    EXPECT_EQ(r.imagePos, QPointF(24.0, 20.0));
}

TEST(EdgeSnapperTest, TinyBufferKeepsPoint) {
    EdgeSnapper snapper;
    const LumaCache luma = EdgeSnapper::buildLumaCache(verticalStepImage(2, 2, 1));

    const SnapResult r = snapper.findSnap(QPointF(1.0, 1.0), 1.0, luma);
    EXPECT_FALSE(r.snapped);
    EXPECT_EQ(r.imagePos, QPointF(1.0, 1.0));
}

TEST(EdgeSnapperTest, PointOutsideImageIsClampedBeforeSearch) {
    EdgeSnapper snapper;
    const LumaCache luma = EdgeSnapper::buildLumaCache(verticalStepImage(30, 30, 2));

    // Search centre clamps to (1, 1); edge columns 1 and 2 are inside the window
    const SnapResult r = snapper.findSnap(QPointF(-40.0, -40.0), 1.0, luma);
    ASSERT_TRUE(r.snapped);
    EXPECT_DOUBLE_EQ(r.imagePos.x(), 1.0);
    EXPECT_DOUBLE_EQ(r.imagePos.y(), 1.0);
}

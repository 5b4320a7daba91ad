#include "tests/test_common.h"
#include "restore/reconstruct/geometry.h"
#include <cmath>

using namespace restore;
using namespace restore_test;

TEST(GeometryTest, WeightBuckets) {
    EXPECT_STREQ(mapWeightToStyle(100), "Thin");
    EXPECT_STREQ(mapWeightToStyle(150), "ExtraLight");
    EXPECT_STREQ(mapWeightToStyle(200), "ExtraLight");
    EXPECT_STREQ(mapWeightToStyle(300), "Light");
    EXPECT_STREQ(mapWeightToStyle(400), "Regular");
    EXPECT_STREQ(mapWeightToStyle(450), "Medium");
    EXPECT_STREQ(mapWeightToStyle(600), "SemiBold");
    EXPECT_STREQ(mapWeightToStyle(700), "Bold");
    EXPECT_STREQ(mapWeightToStyle(800), "ExtraBold");
    EXPECT_STREQ(mapWeightToStyle(950), "Black");
    EXPECT_STREQ(mapWeightToStyle(0), "Thin");
}

TEST(GeometryTest, StyleNamesMapBackToBucketBounds) {
    EXPECT_FLOAT_EQ(mapStyleToWeight("Thin"), 100.0f);
    EXPECT_FLOAT_EQ(mapStyleToWeight("Regular"), 400.0f);
    EXPECT_FLOAT_EQ(mapStyleToWeight("SemiBold"), 600.0f);
    EXPECT_FLOAT_EQ(mapStyleToWeight("Bold"), 700.0f);
    EXPECT_FLOAT_EQ(mapStyleToWeight("Black"), 900.0f);
    EXPECT_FLOAT_EQ(mapStyleToWeight("Condensed Oblique"), 400.0f);
    for (float w : {100.0f, 200.0f, 300.0f, 400.0f, 500.0f, 600.0f, 700.0f, 800.0f, 900.0f}) {
        EXPECT_FLOAT_EQ(mapStyleToWeight(mapWeightToStyle(w)), w);
    }
}

TEST(GeometryTest, RelativePositionSubtractsParentOrigin) {
    SnapshotNode parent = makeNode("FRAME", "P", 100, 50, 300, 200);
    SnapshotNode child = makeNode("RECTANGLE", "C", 130, 40, 10, 10);
    const Vec2 p = computeRelativePosition(child, parent);
    EXPECT_FLOAT_EQ(p.x, 30.0f);
    EXPECT_FLOAT_EQ(p.y, -10.0f);
}

TEST(GeometryTest, RelativePositionWithoutBoxesIsOrigin) {
    SnapshotNode parent = makeNode("FRAME", "P");
    SnapshotNode child = makeNode("RECTANGLE", "C", 130, 40, 10, 10);
    const Vec2 p = computeRelativePosition(child, parent);
    EXPECT_FLOAT_EQ(p.x, 0.0f);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
}

TEST(GeometryTest, GradientTransformFromTwoHandles) {
    HandlePosition a;
    a.x = 0.0f;
    a.y = 0.5f;
    HandlePosition b;
    b.x = 1.0f;
    b.y = 0.5f;
    const Transform2D t = computeGradientTransform({a, b});
    EXPECT_FLOAT_EQ(t.m[0][0], 1.0f);
    EXPECT_FLOAT_EQ(t.m[0][1], 0.0f);
    EXPECT_FLOAT_EQ(t.m[0][2], 0.0f);
    EXPECT_FLOAT_EQ(t.m[1][0], -0.0f);
    EXPECT_FLOAT_EQ(t.m[1][1], 1.0f);
    EXPECT_FLOAT_EQ(t.m[1][2], 0.5f);
}

TEST(GeometryTest, GradientTransformDirectionSign) {
    HandlePosition a;
    a.x = 0.0f;
    a.y = 0.0f;
    HandlePosition b;
    b.x = 0.0f;
    b.y = 2.0f;
    const Transform2D t = computeGradientTransform({a, b});
    // Pointing down: cos 0, sin 1
    EXPECT_NEAR(t.m[0][0], 0.0f, 1e-6f);
    EXPECT_FLOAT_EQ(t.m[0][1], 1.0f);
    EXPECT_FLOAT_EQ(t.m[1][0], -1.0f);
    EXPECT_NEAR(t.m[1][1], 0.0f, 1e-6f);
}

TEST(GeometryTest, GradientTransformIsPureAndIgnoresThirdHandle) {
    HandlePosition a;
    a.x = 0.2f;
    a.y = 0.1f;
    HandlePosition b;
    b.x = 0.8f;
    b.y = 0.9f;
    HandlePosition c;
    c.x = 5.0f;
    c.y = -3.0f;
    const Transform2D t1 = computeGradientTransform({a, b});
    const Transform2D t2 = computeGradientTransform({a, b, c});
    const Transform2D t3 = computeGradientTransform({a, b});
    for (int r = 0; r < 2; ++r) {
        for (int col = 0; col < 3; ++col) {
            EXPECT_EQ(t1.m[r][col], t2.m[r][col]);
            EXPECT_EQ(t1.m[r][col], t3.m[r][col]);
        }
    }
}

TEST(GeometryTest, GradientTransformDegenerateCases) {
    const Transform2D none = computeGradientTransform({});
    EXPECT_FLOAT_EQ(none.m[0][0], 1.0f);
    EXPECT_FLOAT_EQ(none.m[1][1], 1.0f);
    EXPECT_FLOAT_EQ(none.m[0][2], 0.0f);

    HandlePosition a;
    a.x = 0.3f;
    a.y = 0.3f;
    const Transform2D one = computeGradientTransform({a});
    EXPECT_FLOAT_EQ(one.m[0][0], 1.0f);
    EXPECT_FLOAT_EQ(one.m[0][2], 0.0f);

    // Coincident handles: zero length treated as 1, no NaN
    const Transform2D same = computeGradientTransform({a, a});
    EXPECT_FALSE(std::isnan(same.m[0][0]));
    EXPECT_FLOAT_EQ(same.m[0][0], 0.0f);
    EXPECT_FLOAT_EQ(same.m[0][2], 0.3f);
}

TEST(GeometryTest, SnapshotSizeClampsAndFallsBack) {
    float w = 0.0f;
    float h = 0.0f;
    SnapshotNode boxed = makeNode("FRAME", "F", 0, 0, 0.25f, 40);
    ASSERT_TRUE(snapshotSize(boxed, w, h));
    EXPECT_FLOAT_EQ(w, 1.0f);
    EXPECT_FLOAT_EQ(h, 40.0f);

    SnapshotNode declared = makeNode("FRAME", "F");
    declared.size = Vec2{0.0f, 12.0f};
    ASSERT_TRUE(snapshotSize(declared, w, h));
    EXPECT_FLOAT_EQ(w, 1.0f);
    EXPECT_FLOAT_EQ(h, 12.0f);

    SnapshotNode bare = makeNode("FRAME", "F");
    EXPECT_FALSE(snapshotSize(bare, w, h));
}

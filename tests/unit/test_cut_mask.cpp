#include <gtest/gtest.h>
#include "coloranalysis/cutmask.h"


namespace {

bool at(const QVector<bool>& mask, int width, int x, int y) {
    return mask[y * width + x];
}

} // namespace

// =============================================================================
// Stroke stack
// =============================================================================

TEST(CutMaskTest, RejectsDegenerateStrokes) {
    CutMask cuts(10, 10);
    EXPECT_FALSE(cuts.addStroke({QPointF(1, 1)}, 3));
    EXPECT_FALSE(cuts.addStroke({QPointF(1, 1), QPointF(5, 1)}, 0));
    EXPECT_TRUE(cuts.isEmpty());

    CutMask unsized;
    EXPECT_FALSE(unsized.addStroke({QPointF(1, 1), QPointF(5, 1)}, 3));
}

TEST(CutMaskTest, EmptyStackHasNoMask) {
    CutMask cuts(10, 10);
    EXPECT_TRUE(cuts.mask().isEmpty());
    EXPECT_FALSE(cuts.undoStroke());
}

TEST(CutMaskTest, UndoAndClear) {
    CutMask cuts(10, 10);
    ASSERT_TRUE(cuts.addStroke({QPointF(0, 0), QPointF(9, 0)}, 1));
    ASSERT_TRUE(cuts.addStroke({QPointF(0, 9), QPointF(9, 9)}, 1));
    EXPECT_EQ(cuts.strokeCount(), 2);

    EXPECT_TRUE(cuts.undoStroke());
    ASSERT_EQ(cuts.strokeCount(), 1);
    const QVector<bool> m = cuts.mask();
    EXPECT_TRUE(at(m, 10, 4, 0));
    EXPECT_FALSE(at(m, 10, 4, 9));

    cuts.clear();
    EXPECT_TRUE(cuts.isEmpty());
    EXPECT_TRUE(cuts.mask().isEmpty());
}

// =============================================================================
// Rasterization
// =============================================================================

TEST(CutMaskTest, ThinLineCoversItsPixels) {
    CutMask cuts(10, 10);
    ASSERT_TRUE(cuts.addStroke({QPointF(0, 0), QPointF(5, 0)}, 1));

    const QVector<bool> m = cuts.mask();
    ASSERT_EQ(m.size(), 100);
    for (int x = 0; x <= 5; ++x)
        EXPECT_TRUE(at(m, 10, x, 0)) << "x=" << x;
    EXPECT_FALSE(at(m, 10, 6, 0));
    EXPECT_FALSE(at(m, 10, 0, 1));
}

TEST(CutMaskTest, BrushWidthThickensLine) {
    CutMask cuts(15, 10);
    ASSERT_TRUE(cuts.addStroke({QPointF(2, 5), QPointF(12, 5)}, 3));

    const QVector<bool> m = cuts.mask();
    EXPECT_TRUE(at(m, 15, 7, 4));
    EXPECT_TRUE(at(m, 15, 7, 5));
    EXPECT_TRUE(at(m, 15, 7, 6));
    EXPECT_FALSE(at(m, 15, 7, 2));
    EXPECT_FALSE(at(m, 15, 7, 8));
}

TEST(CutMaskTest, StrokesAreUnited) {
    CutMask cuts(10, 10);
    ASSERT_TRUE(cuts.addStroke({QPointF(0, 2), QPointF(9, 2)}, 1));
    ASSERT_TRUE(cuts.addStroke({QPointF(4, 0), QPointF(4, 9)}, 1));

    const QVector<bool> m = cuts.mask();
    EXPECT_TRUE(at(m, 10, 0, 2));
    EXPECT_TRUE(at(m, 10, 4, 7));
    EXPECT_TRUE(at(m, 10, 4, 2));
    EXPECT_FALSE(at(m, 10, 0, 7));
}

TEST(CutMaskTest, PolylineFollowsAllPoints) {
    CutMask cuts(10, 10);
    ASSERT_TRUE(cuts.addStroke({QPointF(1, 1), QPointF(6, 1), QPointF(6, 6)}, 1));

    const QVector<bool> m = cuts.mask();
    EXPECT_TRUE(at(m, 10, 3, 1));
    EXPECT_TRUE(at(m, 10, 6, 4));
    EXPECT_FALSE(at(m, 10, 3, 4));   // не замыкается
}

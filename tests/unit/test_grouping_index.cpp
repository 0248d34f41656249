#include <gtest/gtest.h>
#include "groupingindex.h"
#include "datameasurement.h"
#include "scalecalibration.h"

#include <cmath>

namespace {

class GroupingIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        calib.set(100.0, 50.0, LengthUnit::Nanometer);   // 0.5 nm/px
        // центры: (5,0), (15,10), (50,50)
        store.add({0, 0}, {10, 0}, calib);
        store.add({10, 10}, {20, 10}, calib);
        store.add({40, 50}, {60, 50}, calib);
    }

    int groupOf(int index) const { return store.measurements()[index].groupId; }

    ScaleCalibration calib;
    DataMeasurement store;
    GroupingIndex index;
};

} // namespace

// =============================================================================
// Creation
// =============================================================================

TEST_F(GroupingIndexTest, CreateNormalizesAndLabels) {
    const MeasurementGroup g = index.createGroup(QRectF(QPointF(20, 20), QPointF(0, 0)));
    EXPECT_EQ(g.groupId, 1);
    EXPECT_EQ(g.label, QStringLiteral("G1"));
    EXPECT_DOUBLE_EQ(g.bounds.left(), 0.0);
    EXPECT_DOUBLE_EQ(g.bounds.width(), 20.0);

    const MeasurementGroup named = index.createGroup(QRectF(0, 0, 5, 5), "  large ");
    EXPECT_EQ(named.label, QStringLiteral("large"));
    EXPECT_EQ(index.labelOf(named.groupId), QStringLiteral("large"));
    EXPECT_TRUE(index.labelOf(MeasureConst::kNoGroup).isEmpty());
}

// =============================================================================
// Membership
// =============================================================================

TEST_F(GroupingIndexTest, AssignIsIdempotent) {
    const MeasurementGroup g = index.createGroup(QRectF(0, 0, 20, 20));
    ASSERT_EQ(index.assignMemberships(g.groupId, store), MeasureError::None);
    const QVector<int> first = {groupOf(0), groupOf(1), groupOf(2)};

    ASSERT_EQ(index.assignMemberships(g.groupId, store), MeasureError::None);
    EXPECT_EQ(first, (QVector<int>{groupOf(0), groupOf(1), groupOf(2)}));
    EXPECT_EQ(first, (QVector<int>{g.groupId, g.groupId, MeasureConst::kNoGroup}));
}

TEST_F(GroupingIndexTest, EdgesAreInclusive) {
    const MeasurementGroup g = index.createGroup(QRectF(QPointF(5, 0), QPointF(15, 10)));
    index.assignMemberships(g.groupId, store);
    EXPECT_EQ(groupOf(0), g.groupId);
    EXPECT_EQ(groupOf(1), g.groupId);
}

TEST_F(GroupingIndexTest, NewerGroupKeepsOverlap) {
    const MeasurementGroup older = index.createGroup(QRectF(0, 0, 20, 20));
    const MeasurementGroup newer = index.createGroup(QRectF(10, 5, 10, 10));

    index.assignMemberships(newer.groupId, store);
    index.assignMemberships(older.groupId, store);

    EXPECT_EQ(groupOf(0), older.groupId);
    EXPECT_EQ(groupOf(1), newer.groupId);

    index.reassignAll(store);
    EXPECT_EQ(groupOf(1), newer.groupId);
}

TEST_F(GroupingIndexTest, ShrunkBoundsReleaseMembers) {
    const MeasurementGroup g = index.createGroup(QRectF(0, 0, 20, 20));
    index.assignMemberships(g.groupId, store);
    ASSERT_EQ(groupOf(1), g.groupId);

    ASSERT_EQ(index.setBounds(g.groupId, QRectF(0, 0, 8, 8)), MeasureError::None);
    index.assignMemberships(g.groupId, store);
    EXPECT_EQ(groupOf(0), g.groupId);
    EXPECT_EQ(groupOf(1), MeasureConst::kNoGroup);
}

TEST_F(GroupingIndexTest, UnknownGroup) {
    EXPECT_EQ(index.assignMemberships(99, store), MeasureError::NotFound);
    EXPECT_EQ(index.setBounds(99, QRectF()), MeasureError::NotFound);
    EXPECT_EQ(index.deleteGroup(99, store), MeasureError::NotFound);
    SampleStatistics s;
    EXPECT_EQ(index.groupStatistics(99, store, calib, &s), MeasureError::NotFound);
}

// =============================================================================
// Statistics / delete
// =============================================================================

TEST_F(GroupingIndexTest, GroupStatisticsInDisplayUnit) {
    const MeasurementGroup g = index.createGroup(QRectF(0, 0, 20, 20));
    index.assignMemberships(g.groupId, store);

    SampleStatistics s;
    ASSERT_EQ(index.groupStatistics(g.groupId, store, calib, &s), MeasureError::None);
    EXPECT_EQ(s.count, 2);
    EXPECT_DOUBLE_EQ(s.mean, 5.0);   // оба по 10 px = 5 nm
    EXPECT_DOUBLE_EQ(s.std, 0.0);
}

TEST_F(GroupingIndexTest, EmptyGroupStatistics) {
    const MeasurementGroup g = index.createGroup(QRectF(200, 200, 10, 10));
    index.assignMemberships(g.groupId, store);

    SampleStatistics s;
    EXPECT_EQ(index.groupStatistics(g.groupId, store, calib, &s), MeasureError::EmptyGroup);
    EXPECT_EQ(s.count, 0);
    EXPECT_TRUE(std::isnan(s.mean));
}

TEST_F(GroupingIndexTest, DeleteReleasesMembers) {
    const MeasurementGroup g = index.createGroup(QRectF(0, 0, 20, 20));
    index.assignMemberships(g.groupId, store);

    ASSERT_EQ(index.deleteGroup(g.groupId, store), MeasureError::None);
    EXPECT_TRUE(index.isEmpty());
    EXPECT_EQ(groupOf(0), MeasureConst::kNoGroup);
    EXPECT_EQ(groupOf(1), MeasureConst::kNoGroup);
}

TEST_F(GroupingIndexTest, CountInside) {
    EXPECT_EQ(GroupingIndex::countInside(QRectF(0, 0, 20, 20), store), 2);
    EXPECT_EQ(GroupingIndex::countInside(QRectF(QPointF(60, 60), QPointF(45, 45)), store), 1);
    EXPECT_EQ(GroupingIndex::countInside(QRectF(100, 100, 5, 5), store), 0);
}

TEST_F(GroupingIndexTest, ClearRemovesAllGroups) {
    const MeasurementGroup g = index.createGroup(QRectF(0, 0, 20, 20));
    index.assignMemberships(g.groupId, store);
    index.clear(store);
    EXPECT_TRUE(index.isEmpty());
    EXPECT_EQ(groupOf(0), MeasureConst::kNoGroup);
}

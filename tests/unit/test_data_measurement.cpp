#include <gtest/gtest.h>
#include "datameasurement.h"
#include "scalecalibration.h"

namespace {

ScaleCalibration nmScale() {
    ScaleCalibration c;
    c.set(100.0, 50.0, LengthUnit::Nanometer);   // 5 Å/px
    return c;
}

bool sameMeasurement(const Measurement& a, const Measurement& b) {
    return a.id == b.id && a.p1 == b.p1 && a.p2 == b.p2
        && a.pixelDistance == b.pixelDistance
        && a.physicalValue == b.physicalValue
        && a.groupId == b.groupId;
}

} // namespace

// =============================================================================
// Add
// =============================================================================

TEST(DataMeasurementTest, AddRequiresCalibration) {
    DataMeasurement store;
    ScaleCalibration none;
    EXPECT_EQ(store.add({0, 0}, {10, 0}, none), MeasureError::Uncalibrated);
    EXPECT_TRUE(store.isEmpty());
    EXPECT_FALSE(store.canUndo());
}

TEST(DataMeasurementTest, AddRejectsCoincidentPoints) {
    DataMeasurement store;
    EXPECT_EQ(store.add({4, 4}, {4, 4}, nmScale()), MeasureError::InvalidScale);
    EXPECT_TRUE(store.isEmpty());
}

TEST(DataMeasurementTest, AddComputesValues) {
    DataMeasurement store;
    Measurement m;
    ASSERT_EQ(store.add({0, 0}, {3, 4}, nmScale(), &m), MeasureError::None);

    EXPECT_EQ(m.id, 1);
    EXPECT_DOUBLE_EQ(m.pixelDistance, 5.0);
    EXPECT_DOUBLE_EQ(m.physicalValue, 25.0);   // Å
    EXPECT_EQ(m.groupId, MeasureConst::kNoGroup);
    EXPECT_EQ(m.center(), QPointF(1.5, 2.0));
    EXPECT_EQ(store.size(), 1);
}

// =============================================================================
// Undo / remove
// =============================================================================

TEST(DataMeasurementTest, UndoRestoresPriorState) {
    DataMeasurement store;
    const ScaleCalibration c = nmScale();
    store.add({0, 0}, {10, 0}, c);
    store.add({5, 5}, {5, 25}, c);
    const MeasurementList before = store.measurements();

    ASSERT_EQ(store.add({1, 1}, {2, 2}, c), MeasureError::None);
    int removed = 0;
    ASSERT_EQ(store.undo(&removed), MeasureError::None);
    EXPECT_EQ(removed, 3);

    const MeasurementList after = store.measurements();
    ASSERT_EQ(after.size(), before.size());
    for (int i = 0; i < before.size(); ++i)
        EXPECT_TRUE(sameMeasurement(after[i], before[i]));
}

TEST(DataMeasurementTest, UndoOnEmpty) {
    DataMeasurement store;
    EXPECT_EQ(store.undo(), MeasureError::NothingToUndo);
}

TEST(DataMeasurementTest, UndoAfterManualDeleteDropsStaleEntry) {
    DataMeasurement store;
    const ScaleCalibration c = nmScale();
    store.add({0, 0}, {10, 0}, c);
    store.add({0, 0}, {20, 0}, c);
    ASSERT_EQ(store.remove(2), MeasureError::None);

    EXPECT_EQ(store.undo(), MeasureError::NothingToUndo);
    EXPECT_EQ(store.size(), 1);

    int removed = 0;
    EXPECT_EQ(store.undo(&removed), MeasureError::None);
    EXPECT_EQ(removed, 1);
    EXPECT_TRUE(store.isEmpty());
}

TEST(DataMeasurementTest, RemoveUnknown) {
    DataMeasurement store;
    store.add({0, 0}, {10, 0}, nmScale());
    EXPECT_EQ(store.remove(42), MeasureError::NotFound);
    EXPECT_EQ(store.size(), 1);
}

TEST(DataMeasurementTest, LookupAfterScatteredRemovals) {
    DataMeasurement store;
    const ScaleCalibration c = nmScale();
    for (int i = 0; i < 20; ++i) store.add({0, 0}, {10.0 + i, 0}, c);

    for (int id : {1, 4, 5, 11, 20})
        ASSERT_EQ(store.remove(id), MeasureError::None);
    EXPECT_EQ(store.remove(11), MeasureError::NotFound);

    ASSERT_EQ(store.size(), 15);
    for (int i = 0; i < store.size(); ++i) {
        const int id = store.measurements()[i].id;
        EXPECT_EQ(store.indexOf(id), i);
        ASSERT_NE(store.find(id), nullptr);
        EXPECT_DOUBLE_EQ(store.find(id)->pixelDistance, 9.0 + id);
    }
    EXPECT_EQ(store.indexOf(5), -1);
    EXPECT_EQ(store.find(20), nullptr);
    EXPECT_EQ(store.indexOf(21), -1);

    // #20 удалён: первая отмена снимает устаревшую запись, вторая убирает #19
    EXPECT_EQ(store.undo(), MeasureError::NothingToUndo);
    int removed = 0;
    ASSERT_EQ(store.undo(&removed), MeasureError::None);
    EXPECT_EQ(removed, 19);
    EXPECT_EQ(store.measurements().last().id, 18);
}

TEST(DataMeasurementTest, IdsAreNeverReused) {
    DataMeasurement store;
    const ScaleCalibration c = nmScale();
    for (int i = 0; i < 3; ++i) store.add({0, 0}, {10.0 + i, 0}, c);

    store.remove(3);
    store.undo();          // устаревшая запись #3
    store.undo();          // снимает #2

    Measurement m;
    store.add({0, 0}, {7, 0}, c, &m);
    EXPECT_EQ(m.id, 4);

    store.clear();
    store.add({0, 0}, {7, 0}, c, &m);
    EXPECT_EQ(m.id, 5);
    EXPECT_EQ(store.nextId(), 6);
}

// =============================================================================
// Recompute / values
// =============================================================================

TEST(DataMeasurementTest, RecomputeAfterRecalibration) {
    DataMeasurement store;
    store.add({0, 0}, {20, 0}, nmScale());
    ASSERT_DOUBLE_EQ(store.measurements()[0].physicalValue, 100.0);

    ScaleCalibration c2;
    c2.set(10.0, 1.0, LengthUnit::Micrometer);   // 1000 Å/px
    store.recomputeAll(c2);
    EXPECT_DOUBLE_EQ(store.measurements()[0].physicalValue, 20000.0);
    EXPECT_EQ(store.measurements()[0].id, 1);
}

TEST(DataMeasurementTest, ValuesByGroup) {
    DataMeasurement store;
    const ScaleCalibration c = nmScale();
    store.add({0, 0}, {10, 0}, c);
    store.add({0, 0}, {20, 0}, c);
    store.add({0, 0}, {30, 0}, c);
    store.setGroupId(1, 7);

    EXPECT_EQ(store.values().size(), 3);
    ASSERT_EQ(store.values(7).size(), 1);
    EXPECT_DOUBLE_EQ(store.values(7)[0], 100.0);
    EXPECT_EQ(store.values(MeasureConst::kNoGroup).size(), 2);
}

TEST(DataMeasurementTest, FindAndIndex) {
    DataMeasurement store;
    store.add({0, 0}, {10, 0}, nmScale());
    ASSERT_NE(store.find(1), nullptr);
    EXPECT_EQ(store.find(2), nullptr);
    EXPECT_EQ(store.indexOf(1), 0);
    EXPECT_EQ(store.indexOf(9), -1);
}

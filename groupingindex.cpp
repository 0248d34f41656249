#include "groupingindex.h"
#include "datameasurement.h"
#include "scalecalibration.h"
#include "measurecalculator.h"
#include "measurelog.h"

MeasurementGroup GroupingIndex::createGroup(const QRectF& bounds, const QString& label)
{
    MeasurementGroup g;
    g.groupId = ++m_idCounter;
    g.bounds  = bounds.normalized();
    g.label   = label.trimmed().isEmpty() ? QStringLiteral("G%1").arg(g.groupId)
                                          : label.trimmed();
    m_groups.push_back(g);

    qCInfo(lcSession) << "group" << g.label << "created" << g.bounds;
    return g;
}

MeasureError GroupingIndex::assignMemberships(int groupId, DataMeasurement& store) const
{
    const MeasurementGroup* g = find(groupId);
    if (!g)
        return MeasureError::NotFound;

    const MeasurementList& list = store.measurements();
    for (int i = 0; i < list.size(); ++i) {
        const Measurement& m = list[i];
        if (g->contains(m.center())) {
            // более новая группа (больший id) сохраняет измерение
            if (m.groupId == MeasureConst::kNoGroup || m.groupId <= groupId)
                store.setGroupId(i, groupId);
        } else if (m.groupId == groupId) {
            store.setGroupId(i, MeasureConst::kNoGroup);
        }
    }
    return MeasureError::None;
}

void GroupingIndex::reassignAll(DataMeasurement& store) const
{
    for (int i = 0; i < store.size(); ++i)
        store.setGroupId(i, MeasureConst::kNoGroup);

    for (const auto& g : m_groups)
        assignMemberships(g.groupId, store);
}

MeasureError GroupingIndex::setBounds(int groupId, const QRectF& bounds)
{
    for (auto& g : m_groups) {
        if (g.groupId == groupId) {
            g.bounds = bounds.normalized();
            return MeasureError::None;
        }
    }
    return MeasureError::NotFound;
}

MeasureError GroupingIndex::groupStatistics(int groupId, const DataMeasurement& store,
                                            const ScaleCalibration& calibration,
                                            SampleStatistics* stats) const
{
    if (!find(groupId))
        return MeasureError::NotFound;

    QVector<double> values = store.values(groupId);
    for (double& v : values) v = calibration.toDisplay(v);

    const SampleStatistics s = MeasureCalculator::describe(values);
    if (stats) *stats = s;
    return s.count == 0 ? MeasureError::EmptyGroup : MeasureError::None;
}

MeasureError GroupingIndex::deleteGroup(int groupId, DataMeasurement& store)
{
    int pos = -1;
    for (int i = 0; i < m_groups.size(); ++i) {
        if (m_groups[i].groupId == groupId) { pos = i; break; }
    }
    if (pos < 0)
        return MeasureError::NotFound;

    // сначала освободить членов
    const MeasurementList& list = store.measurements();
    for (int i = 0; i < list.size(); ++i) {
        if (list[i].groupId == groupId)
            store.setGroupId(i, MeasureConst::kNoGroup);
    }

    qCInfo(lcSession) << "group" << m_groups[pos].label << "deleted";
    m_groups.removeAt(pos);
    return MeasureError::None;
}

int GroupingIndex::countInside(const QRectF& rect, const DataMeasurement& store)
{
    MeasurementGroup candidate;
    candidate.bounds = rect.normalized();

    int n = 0;
    for (const auto& m : store.measurements()) {
        if (candidate.contains(m.center())) ++n;
    }
    return n;
}

void GroupingIndex::clear(DataMeasurement& store)
{
    for (int i = 0; i < store.size(); ++i)
        store.setGroupId(i, MeasureConst::kNoGroup);
    m_groups.clear();
}

const MeasurementGroup* GroupingIndex::find(int groupId) const
{
    for (const auto& g : m_groups) {
        if (g.groupId == groupId)
            return &g;
    }
    return nullptr;
}

QString GroupingIndex::labelOf(int groupId) const
{
    const MeasurementGroup* g = find(groupId);
    return g ? g->label : QString();
}

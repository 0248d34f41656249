#include "measurementsession.h"
#include "measurecalculator.h"
#include "measurelog.h"

// ------------------------
// Масштаб
// ------------------------
MeasureError MeasurementSession::calibrate(double pixelDistance, double physicalLength, LengthUnit unit)
{
    const MeasureError err = m_calibration.set(pixelDistance, physicalLength, unit);
    if (err != MeasureError::None)
        return err;

    m_store.recomputeAll(m_calibration);
    return MeasureError::None;
}

void MeasurementSession::setDisplayUnit(LengthUnit unit)
{
    m_calibration.setDisplayUnit(unit);
    qCDebug(lcSession) << "display unit" << ::unitSymbol(unit);
}

// ------------------------
// Измерения
// ------------------------
MeasureError MeasurementSession::addMeasurement(const QPointF& p1, const QPointF& p2, Measurement* out)
{
    Measurement m;
    const MeasureError err = m_store.add(p1, p2, m_calibration, &m);
    if (err != MeasureError::None) {
        qCWarning(lcSession) << "add rejected:" << errorName(err);
        return err;
    }

    // новое измерение сразу попадает в группу, если его центр внутри рамки
    const GroupList& gl = m_groups.groups();
    for (int i = gl.size() - 1; i >= 0; --i) {
        if (gl[i].contains(m.center())) {
            m.groupId = gl[i].groupId;
            m_store.setGroupId(m_store.indexOf(m.id), m.groupId);
            break;
        }
    }

    if (out) *out = m;
    return MeasureError::None;
}

MeasureError MeasurementSession::undo(int* removedId)
{
    return m_store.undo(removedId);
}

MeasureError MeasurementSession::remove(int id)
{
    return m_store.remove(id);
}

void MeasurementSession::clear()
{
    m_groups.clear(m_store);
    m_store.clear();
    qCInfo(lcSession) << "session cleared";
}

// ------------------------
// Группы
// ------------------------
MeasurementGroup MeasurementSession::createGroup(const QRectF& bounds, const QString& label,
                                                 int* members)
{
    const MeasurementGroup g = m_groups.createGroup(bounds, label);
    m_groups.assignMemberships(g.groupId, m_store);
    if (members) *members = memberCount(g.groupId);
    return g;
}

MeasureError MeasurementSession::deleteGroup(int groupId)
{
    return m_groups.deleteGroup(groupId, m_store);
}

void MeasurementSession::reassignGroups()
{
    m_groups.reassignAll(m_store);
}

int MeasurementSession::memberCount(int groupId) const
{
    int n = 0;
    for (const auto& m : m_store.measurements()) {
        if (m.groupId == groupId) ++n;
    }
    return n;
}

// ------------------------
// Статистика
// ------------------------
QVector<double> MeasurementSession::displayValues(int groupId) const
{
    QVector<double> values = m_store.values(groupId);
    for (double& v : values) v = m_calibration.toDisplay(v);
    return values;
}

SampleStatistics MeasurementSession::statistics(int groupId) const
{
    return MeasureCalculator::describe(displayValues(groupId));
}

MeasureError MeasurementSession::groupStatistics(int groupId, SampleStatistics* stats) const
{
    return m_groups.groupStatistics(groupId, m_store, m_calibration, stats);
}

MeasureError MeasurementSession::fitDistribution(DistributionFit* fit, int binCount,
                                                 int groupId, FitMethod method) const
{
    if (groupId != MeasureConst::kAllGroups && !m_groups.find(groupId))
        return MeasureError::NotFound;

    return DistributionFitter::fit(displayValues(groupId), binCount, fit, method);
}

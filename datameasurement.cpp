#include "datameasurement.h"
#include "measurecalculator.h"
#include "scalecalibration.h"
#include "measurelog.h"

#include <algorithm>

// ------------------------
// Публичные методы
// ------------------------
MeasureError DataMeasurement::add(const QPointF& p1, const QPointF& p2,
                                  const ScaleCalibration& calibration, Measurement* out)
{
    if (!calibration.isCalibrated())
        return MeasureError::Uncalibrated;

    const double dist = MeasureCalculator::distance(p1, p2);
    if (!(dist > 0.0))
        return MeasureError::InvalidScale;

    double value = 0.0;
    const MeasureError err = calibration.convert(dist, &value);
    if (err != MeasureError::None)
        return err;

    Measurement m;
    m.id            = ++m_idCounter;
    m.p1            = p1;
    m.p2            = p2;
    m.pixelDistance = dist;
    m.physicalValue = value;

    m_measurements.push_back(m);
    m_undoStack.push_back(m.id);

    qCDebug(lcSession) << "add #" << m.id << dist << "px ->" << value << "A";

    if (out) *out = m;
    return MeasureError::None;
}

MeasureError DataMeasurement::undo(int* removedId)
{
    if (m_undoStack.isEmpty())
        return MeasureError::NothingToUndo;

    // Последнее добавленное, если оно ещё в журнале, всегда стоит в конце
    const int id = m_undoStack.takeLast();
    if (m_measurements.isEmpty() || m_measurements.last().id != id) {
        // последнее добавленное уже удалено вручную
        qCDebug(lcSession) << "undo: #" << id << "already deleted";
        return MeasureError::NothingToUndo;
    }

    m_measurements.removeLast();
    if (removedId) *removedId = id;
    return MeasureError::None;
}

MeasureError DataMeasurement::remove(int id)
{
    const int idx = indexOf(id);
    if (idx < 0)
        return MeasureError::NotFound;

    m_measurements.removeAt(idx);
    return MeasureError::None;
}

void DataMeasurement::recomputeAll(const ScaleCalibration& calibration)
{
    for (auto& m : m_measurements) {
        double value = 0.0;
        if (calibration.convert(m.pixelDistance, &value) == MeasureError::None)
            m.physicalValue = value;
    }
}

void DataMeasurement::clear()
{
    m_measurements.clear();
    m_undoStack.clear();
    // m_idCounter не сбрасывается: id не переиспользуются
}

// ------------------------
// Доступ
// ------------------------
const Measurement* DataMeasurement::find(int id) const
{
    const int idx = indexOf(id);
    return idx < 0 ? nullptr : &m_measurements[idx];
}

// id растут в порядке добавления, удаление порядок не нарушает: двоичный поиск
int DataMeasurement::indexOf(int id) const
{
    const auto it = std::lower_bound(m_measurements.cbegin(), m_measurements.cend(), id,
                                     [](const Measurement& m, int value) { return m.id < value; });
    if (it == m_measurements.cend() || it->id != id)
        return -1;
    return static_cast<int>(it - m_measurements.cbegin());
}

QVector<double> DataMeasurement::values(int groupId) const
{
    QVector<double> out;
    out.reserve(m_measurements.size());
    for (const auto& m : m_measurements) {
        if (groupId == MeasureConst::kAllGroups || m.groupId == groupId)
            out.push_back(m.physicalValue);
    }
    return out;
}

void DataMeasurement::setGroupId(int index, int groupId)
{
    if (index < 0 || index >= m_measurements.size())
        return;
    m_measurements[index].groupId = groupId;
}

#ifndef MEASUREMENTSESSION_H
#define MEASUREMENTSESSION_H

#include <QPointF>
#include <QRectF>
#include <QString>
#include "scalecalibration.h"
#include "datameasurement.h"
#include "groupingindex.h"
#include "distributionfitter.h"

// ─────────────────────────────────────────────────────
// Сессия одного открытого изображения: масштаб, журнал измерений, группы.
// Создаётся при загрузке изображения, удаляется при закрытии/следующей загрузке.
// ─────────────────────────────────────────────────────
class MeasurementSession
{
public:
    MeasurementSession() = default;

    // ——— Масштаб ———
    // При успехе пересчитывает все измерения
    MeasureError calibrate(double pixelDistance, double physicalLength, LengthUnit unit);
    void setDisplayUnit(LengthUnit unit);
    LengthUnit displayUnit() const { return m_calibration.displayUnit(); }
    bool isCalibrated() const { return m_calibration.isCalibrated(); }

    // ——— Измерения ———
    MeasureError addMeasurement(const QPointF& p1, const QPointF& p2, Measurement* out = nullptr);
    MeasureError undo(int* removedId = nullptr);
    MeasureError remove(int id);
    void clear();                        // измерения и группы

    // ——— Группы ———
    // Рамка нормализуется, принадлежность назначается сразу
    MeasurementGroup createGroup(const QRectF& bounds, const QString& label = QString(),
                                 int* memberCount = nullptr);
    MeasureError deleteGroup(int groupId);
    void reassignGroups();
    int memberCount(int groupId) const;

    // ——— Статистика и распределение (единица отображения) ———
    // kAllGroups: все измерения
    SampleStatistics statistics(int groupId = MeasureConst::kAllGroups) const;
    MeasureError groupStatistics(int groupId, SampleStatistics* stats) const;
    QVector<double> displayValues(int groupId = MeasureConst::kAllGroups) const;
    MeasureError fitDistribution(DistributionFit* fit, int binCount = 0,
                                 int groupId = MeasureConst::kAllGroups,
                                 FitMethod method = FitMethod::LeastSquares) const;

    // Доступ к частям
    const ScaleCalibration& calibration() const { return m_calibration; }
    const DataMeasurement& store() const { return m_store; }
    const GroupingIndex& groups() const { return m_groups; }

    // Значение измерения в единице отображения
    double displayValue(const Measurement& m) const { return m_calibration.toDisplay(m.physicalValue); }
    QString unitSymbol() const { return ::unitSymbol(m_calibration.displayUnit()); }

private:
    ScaleCalibration m_calibration;
    DataMeasurement  m_store;
    GroupingIndex    m_groups;
};

#endif // MEASUREMENTSESSION_H

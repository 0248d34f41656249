#ifndef DATAMEASUREMENT_H
#define DATAMEASUREMENT_H

#include <QVector>
#include <QPointF>
#include "typemeasurement.h"
#include "measureerror.h"

class ScaleCalibration;

// Журнал измерений: порядок добавления = порядок экспорта и отмены
class DataMeasurement
{
public:
    DataMeasurement() = default;

    // Добавить измерение по двум точкам.
    // Uncalibrated: масштаб не задан, InvalidScale: точки совпадают
    MeasureError add(const QPointF& p1, const QPointF& p2,
                     const ScaleCalibration& calibration, Measurement* out = nullptr);

    // Отменить последнее добавленное. Если оно уже удалено: NothingToUndo,
    // журнал не меняется, устаревшая запись снимается со стека
    MeasureError undo(int* removedId = nullptr);

    // Удалить по id: поиск O(log n), сдвиг хвоста журнала O(n)
    MeasureError remove(int id);

    // Пересчитать physicalValue всех измерений (id и порядок сохраняются)
    void recomputeAll(const ScaleCalibration& calibration);

    // Очистить журнал; нумерация продолжается
    void clear();

    // Доступ к складу
    const MeasurementList& measurements() const { return m_measurements; }
    int size() const { return m_measurements.size(); }
    bool isEmpty() const { return m_measurements.isEmpty(); }

    const Measurement* find(int id) const;
    int indexOf(int id) const;
    int nextId() const { return m_idCounter + 1; }
    bool canUndo() const { return !m_undoStack.isEmpty(); }

    // Значения в Å; kAllGroups: все, kNoGroup: только вне групп
    QVector<double> values(int groupId = MeasureConst::kAllGroups) const;

    // Кэш принадлежности к группе
    void setGroupId(int index, int groupId);

private:
    MeasurementList m_measurements;      // склад
    QVector<int>    m_undoStack;         // id в порядке добавления; удалённые снимаются при undo
    int             m_idCounter = 0;     // автонумерация измерений
};

#endif // DATAMEASUREMENT_H

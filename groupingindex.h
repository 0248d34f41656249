#ifndef GROUPINGINDEX_H
#define GROUPINGINDEX_H

#include <QRectF>
#include <QString>
#include "typemeasurement.h"
#include "measureerror.h"

class DataMeasurement;
class ScaleCalibration;

// ─────────────────────────────────────────────────────
// Прямоугольные группы и принадлежность измерений к ним.
// Принадлежность кэшируется в Measurement::groupId и пересчитывается
// только по явному запросу (assignMemberships / reassignAll).
// ─────────────────────────────────────────────────────
class GroupingIndex
{
public:
    GroupingIndex() = default;

    // Новая группа; пустая метка → "G<id>"
    MeasurementGroup createGroup(const QRectF& bounds, const QString& label = QString());

    // Отметить измерения, чей центр внутри рамки группы.
    // Центр в более новой группе остаётся за ней; вышедшие из рамки освобождаются
    MeasureError assignMemberships(int groupId, DataMeasurement& store) const;

    // Полный проход по всем группам в порядке создания
    void reassignAll(DataMeasurement& store) const;

    // Изменить рамку без пересчёта принадлежности
    MeasureError setBounds(int groupId, const QRectF& bounds);

    // Статистика группы в единице отображения.
    // NotFound: нет группы, EmptyGroup: нет членов (stats.count = 0)
    MeasureError groupStatistics(int groupId, const DataMeasurement& store,
                                 const ScaleCalibration& calibration,
                                 SampleStatistics* stats) const;

    // Снять принадлежность с членов и удалить группу
    MeasureError deleteGroup(int groupId, DataMeasurement& store);

    // Сколько центров измерений внутри прямоугольника
    static int countInside(const QRectF& rect, const DataMeasurement& store);

    void clear(DataMeasurement& store);

    const MeasurementGroup* find(int groupId) const;
    const GroupList& groups() const { return m_groups; }
    bool isEmpty() const { return m_groups.isEmpty(); }

    // Метка группы или пустая строка для kNoGroup / неизвестного id
    QString labelOf(int groupId) const;

private:
    GroupList m_groups;          // в порядке создания
    int       m_idCounter = 0;   // автонумерация групп
};

#endif // GROUPINGINDEX_H

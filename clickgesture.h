#ifndef CLICKGESTURE_H
#define CLICKGESTURE_H

#include <QPointF>
#include "typemeasurement.h"

// Двухкликовый жест: первая точка → вторая точка → готово.
// Ядро получает только завершённую пару концов.
class ClickGesture
{
public:
    enum class Phase {
        AwaitingFirstPoint,
        AwaitingSecondPoint,
        Completed
    };

    explicit ClickGesture(double minDistance = MeasureConst::kMinClickDistance)
        : m_minDistance(minDistance) {}

    // false: клик отклонён (вторая точка ближе минимума или жест уже завершён)
    bool press(const QPointF& pt);

    // Отменить первую точку; false, если отменять нечего
    bool undoClick();

    // Сбросить после использования завершённой пары
    void reset();

    Phase phase() const { return m_phase; }
    bool isCompleted() const { return m_phase == Phase::Completed; }
    bool hasFirstPoint() const { return m_phase != Phase::AwaitingFirstPoint; }

    QPointF firstPoint() const { return m_first; }
    QPointF secondPoint() const { return m_second; }

    void setMinDistance(double d) { m_minDistance = d; }
    double minDistance() const { return m_minDistance; }

private:
    Phase   m_phase = Phase::AwaitingFirstPoint;
    QPointF m_first;
    QPointF m_second;
    double  m_minDistance;
};

#endif // CLICKGESTURE_H

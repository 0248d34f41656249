#include "clickgesture.h"
#include "measurecalculator.h"

bool ClickGesture::press(const QPointF& pt)
{
    switch (m_phase) {
    case Phase::AwaitingFirstPoint:
        m_first = pt;
        m_phase = Phase::AwaitingSecondPoint;
        return true;

    case Phase::AwaitingSecondPoint:
        if (MeasureCalculator::distance(m_first, pt) < m_minDistance)
            return false;
        m_second = pt;
        m_phase = Phase::Completed;
        return true;

    case Phase::Completed:
        break;
    }
    return false;
}

bool ClickGesture::undoClick()
{
    if (m_phase != Phase::AwaitingSecondPoint)
        return false;
    m_phase = Phase::AwaitingFirstPoint;
    return true;
}

void ClickGesture::reset()
{
    m_phase  = Phase::AwaitingFirstPoint;
    m_first  = QPointF();
    m_second = QPointF();
}

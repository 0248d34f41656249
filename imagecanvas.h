#ifndef IMAGECANVAS_H
#define IMAGECANVAS_H

#include <QWidget>
#include <QImage>
#include <QSet>
#include "appstate.h"

class MeasurementSession;

// ─────────────────────────────────────────────────────
// Просмотр изображения: панорама (правая кнопка), масштаб (колесо),
// отрисовка измерений/групп и передача кликов в координатах изображения.
// Своего состояния измерений не хранит, только читает сессию.
// ─────────────────────────────────────────────────────
class ImageCanvas : public QWidget
{
    Q_OBJECT
public:
    explicit ImageCanvas(QWidget* parent = nullptr);

    void setImage(const QImage& image);
    const QImage& image() const { return m_image; }
    bool hasImage() const { return !m_image.isNull(); }

    void setSession(const MeasurementSession* session);
    void setMode(ProgramState mode);

    // Первая точка незавершённого жеста (рисуется с «резиновой» линией)
    void setPendingPoint(const QPointF& pt);
    void clearPendingPoint();

    // Отрезок калибровки
    void setScaleLine(const QPointF& p1, const QPointF& p2);
    void clearScaleLine();

    void setSelectedIds(const QSet<int>& ids);
    void setMinGroupDrag(double px) { m_minGroupDrag = px; }

    double zoom() const { return m_zoom; }

    QPointF toImage(const QPointF& screen) const { return (screen - m_viewOffset) / m_zoom; }
    QPointF toScreen(const QPointF& image) const { return image * m_zoom + m_viewOffset; }

public slots:
    void zoomIn();
    void zoomOut();
    void fitToWindow();
    void actualSize();

signals:
    void pointClicked(const QPointF& imagePos);
    void rectangleSelected(const QRectF& imageRect);
    void measurementClicked(int id);
    void cursorMoved(const QPointF& imagePos);

protected:
    void paintEvent(QPaintEvent* ev) override;
    void mousePressEvent(QMouseEvent* ev) override;
    void mouseMoveEvent(QMouseEvent* ev) override;
    void mouseReleaseEvent(QMouseEvent* ev) override;
    void wheelEvent(QWheelEvent* ev) override;

private:
    void zoomAround(const QPointF& screenPos, double factor);
    int measurementAt(const QPointF& screenPos) const;   // -1: нет

    QImage m_image;
    const MeasurementSession* m_session = nullptr;
    ProgramState m_mode = ProgramState::Idle;

    double  m_zoom = 1.0;
    QPointF m_viewOffset;

    bool    m_isPanning = false;
    QPointF m_lastMouseScreen;
    QPointF m_mouseImage;

    bool    m_hasPending = false;
    QPointF m_pending;

    bool    m_hasScaleLine = false;
    QPointF m_scaleP1, m_scaleP2;

    bool    m_isDragging = false;        // рамка группы
    QPointF m_dragStart;

    QSet<int> m_selected;
    double    m_minGroupDrag = 3.0;
};

#endif // IMAGECANVAS_H

#include "imagecanvas.h"
#include "measurementsession.h"

#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QtMath>

namespace {
constexpr double kMinZoom  = 0.05;
constexpr double kMaxZoom  = 40.0;
constexpr double kZoomStep = 1.15;
constexpr double kPickRadius = 6.0;   // px экрана для выбора измерения

const QColor kGroupColors[] = {
    QColor("#00FF00"), QColor("#00CCFF"), QColor("#FF9900"), QColor("#FF00FF"),
    QColor("#FFFF00"), QColor("#00FFCC")
};

// расстояние от точки до отрезка
double segmentDistance(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const QPointF ab = b - a;
    const double len2 = QPointF::dotProduct(ab, ab);
    if (len2 <= 0.0)
        return std::hypot(p.x() - a.x(), p.y() - a.y());
    const double t = qBound(0.0, QPointF::dotProduct(p - a, ab) / len2, 1.0);
    const QPointF proj = a + t * ab;
    return std::hypot(p.x() - proj.x(), p.y() - proj.y());
}
}

ImageCanvas::ImageCanvas(QWidget* parent)
    : QWidget(parent)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(320, 240);
    setAutoFillBackground(false);
}

void ImageCanvas::setImage(const QImage& image)
{
    m_image = image;
    m_hasPending = false;
    m_hasScaleLine = false;
    m_selected.clear();
    fitToWindow();
}

void ImageCanvas::setSession(const MeasurementSession* session)
{
    m_session = session;
    update();
}

void ImageCanvas::setMode(ProgramState mode)
{
    m_mode = mode;
    m_isDragging = false;
    switch (mode) {
    case ProgramState::Idle:           setCursor(Qt::ArrowCursor); break;
    case ProgramState::GroupSelecting: setCursor(Qt::CrossCursor); break;
    case ProgramState::PickingColor:   setCursor(Qt::PointingHandCursor); break;
    default:                           setCursor(Qt::CrossCursor); break;
    }
    update();
}

void ImageCanvas::setPendingPoint(const QPointF& pt)
{
    m_pending = pt;
    m_hasPending = true;
    update();
}

void ImageCanvas::clearPendingPoint()
{
    m_hasPending = false;
    update();
}

void ImageCanvas::setScaleLine(const QPointF& p1, const QPointF& p2)
{
    m_scaleP1 = p1;
    m_scaleP2 = p2;
    m_hasScaleLine = true;
    update();
}

void ImageCanvas::clearScaleLine()
{
    m_hasScaleLine = false;
    update();
}

void ImageCanvas::setSelectedIds(const QSet<int>& ids)
{
    m_selected = ids;
    update();
}

// ——— Масштаб ———
void ImageCanvas::zoomAround(const QPointF& screenPos, double factor)
{
    const QPointF imagePos = toImage(screenPos);
    m_zoom = qBound(kMinZoom, m_zoom * factor, kMaxZoom);
    m_viewOffset = screenPos - imagePos * m_zoom;
    update();
}

void ImageCanvas::zoomIn()
{
    zoomAround(QPointF(width() / 2.0, height() / 2.0), kZoomStep);
}

void ImageCanvas::zoomOut()
{
    zoomAround(QPointF(width() / 2.0, height() / 2.0), 1.0 / kZoomStep);
}

void ImageCanvas::fitToWindow()
{
    if (m_image.isNull() || width() <= 0 || height() <= 0) {
        m_zoom = 1.0;
        m_viewOffset = QPointF();
        update();
        return;
    }
    m_zoom = qBound(kMinZoom, qMin(double(width()) / m_image.width(),
                                   double(height()) / m_image.height()), kMaxZoom);
    m_viewOffset = QPointF((width()  - m_image.width()  * m_zoom) / 2.0,
                           (height() - m_image.height() * m_zoom) / 2.0);
    update();
}

void ImageCanvas::actualSize()
{
    zoomAround(QPointF(width() / 2.0, height() / 2.0), 1.0 / m_zoom);
}

// ——— Отрисовка ———
void ImageCanvas::paintEvent(QPaintEvent*)
{
    QPainter p(this);
    p.fillRect(rect(), QColor(34, 34, 34));
    if (m_image.isNull())
        return;

    p.setRenderHint(QPainter::Antialiasing);
    p.save();
    p.translate(m_viewOffset);
    p.scale(m_zoom, m_zoom);
    p.drawImage(QPointF(0, 0), m_image);
    p.restore();

    // Оверлей рисуем в экранных координатах, чтобы толщина линий не зависела от масштаба
    if (m_session) {
        const GroupList& groups = m_session->groups().groups();
        for (int i = 0; i < groups.size(); ++i) {
            const QColor c = kGroupColors[i % (sizeof(kGroupColors) / sizeof(kGroupColors[0]))];
            const QRectF r(toScreen(groups[i].bounds.topLeft()), toScreen(groups[i].bounds.bottomRight()));
            p.setPen(QPen(c, 2, Qt::DashLine));
            p.setBrush(Qt::NoBrush);
            p.drawRect(r);
            p.drawText(r.topLeft() + QPointF(4, 14), groups[i].label);
        }

        for (const auto& m : m_session->store().measurements()) {
            const bool sel = m_selected.contains(m.id);
            const QPointF a = toScreen(m.p1);
            const QPointF b = toScreen(m.p2);
            p.setPen(QPen(sel ? QColor("#FFD700") : QColor("#FF3030"), sel ? 3 : 2));
            p.drawLine(a, b);
            p.drawEllipse(a, 2.5, 2.5);
            p.drawEllipse(b, 2.5, 2.5);
            p.drawText(b + QPointF(4, -4), QString::number(m.id));
        }
    }

    if (m_hasScaleLine) {
        p.setPen(QPen(QColor("#00BFFF"), 2));
        p.drawLine(toScreen(m_scaleP1), toScreen(m_scaleP2));
    }

    if (m_hasPending) {
        const QPointF a = toScreen(m_pending);
        const QColor c = m_mode == ProgramState::Calibrating ? QColor("#00BFFF") : QColor("#FF3030");
        p.setPen(QPen(c, 1, Qt::DashLine));
        p.drawLine(a, toScreen(m_mouseImage));
        p.setPen(QPen(c, 2));
        p.drawLine(a + QPointF(-6, 0), a + QPointF(6, 0));
        p.drawLine(a + QPointF(0, -6), a + QPointF(0, 6));
    }

    if (m_isDragging) {
        p.setPen(QPen(Qt::white, 1, Qt::DashLine));
        p.setBrush(QColor(255, 255, 255, 30));
        p.drawRect(QRectF(toScreen(m_dragStart), toScreen(m_mouseImage)).normalized());
    }
}

// ——— Мышь ———
void ImageCanvas::mousePressEvent(QMouseEvent* ev)
{
    if (ev->button() == Qt::RightButton) {
        m_isPanning = true;
        m_lastMouseScreen = ev->position();
        setCursor(Qt::ClosedHandCursor);
        return;
    }
    if (ev->button() != Qt::LeftButton || m_image.isNull())
        return;

    const QPointF pos = toImage(ev->position());
    switch (m_mode) {
    case ProgramState::Calibrating:
    case ProgramState::Measuring:
    case ProgramState::PickingColor:
        emit pointClicked(pos);
        break;
    case ProgramState::GroupSelecting:
        m_isDragging = true;
        m_dragStart = pos;
        m_mouseImage = pos;
        break;
    case ProgramState::Idle: {
        emit measurementClicked(measurementAt(ev->position()));
        break;
    }
    }
}

void ImageCanvas::mouseMoveEvent(QMouseEvent* ev)
{
    if (m_isPanning) {
        const QPointF now = ev->position();
        m_viewOffset += (now - m_lastMouseScreen);
        m_lastMouseScreen = now;
        update();
        return;
    }

    m_mouseImage = toImage(ev->position());
    emit cursorMoved(m_mouseImage);
    if (m_hasPending || m_isDragging)
        update();
}

void ImageCanvas::mouseReleaseEvent(QMouseEvent* ev)
{
    if (ev->button() == Qt::RightButton) {
        m_isPanning = false;
        setMode(m_mode);
        return;
    }

    if (ev->button() == Qt::LeftButton && m_isDragging) {
        m_isDragging = false;
        const QRectF r = QRectF(m_dragStart, toImage(ev->position())).normalized();
        update();
        // слишком маленькая рамка: случайный клик
        if (r.width() < m_minGroupDrag || r.height() < m_minGroupDrag)
            return;
        emit rectangleSelected(r);
    }
}

void ImageCanvas::wheelEvent(QWheelEvent* ev)
{
    const int delta = ev->angleDelta().y();
    if (delta == 0) { ev->accept(); return; }
    zoomAround(ev->position(), delta > 0 ? kZoomStep : 1.0 / kZoomStep);
    ev->accept();
}

int ImageCanvas::measurementAt(const QPointF& screenPos) const
{
    if (!m_session)
        return -1;

    int best = -1;
    double bestDist = kPickRadius;
    for (const auto& m : m_session->store().measurements()) {
        const double d = segmentDistance(screenPos, toScreen(m.p1), toScreen(m.p2));
        if (d <= bestDist) {
            bestDist = d;
            best = m.id;
        }
    }
    return best;
}

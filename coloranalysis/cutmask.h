#ifndef CUTMASK_H
#define CUTMASK_H

#include <QVector>
#include <QPointF>

// Один штрих разреза в координатах изображения
struct CutStroke {
    QVector<QPointF> points;
    int width = 3;                 // толщина кисти, px изображения
};

// ─────────────────────────────────────────────────────
// Ручные разрезы слипшихся частиц: стек штрихов с отменой.
// mask() отдаёт объединение штрихов для ParticleDetector::detect.
// ─────────────────────────────────────────────────────
class CutMask
{
public:
    CutMask() = default;
    CutMask(int width, int height);

    int width() const { return m_width; }
    int height() const { return m_height; }

    // false: меньше двух точек, кисть < 1 или размер изображения не задан
    bool addStroke(const QVector<QPointF>& points, int brushWidth);
    bool undoStroke();             // false: штрихов нет
    void clear();

    int strokeCount() const { return m_strokes.size(); }
    bool isEmpty() const { return m_strokes.isEmpty(); }
    const QVector<CutStroke>& strokes() const { return m_strokes; }

    // width*height, true: пиксель вырезан. Пусто, если штрихов нет
    QVector<bool> mask() const;

private:
    int m_width = 0;
    int m_height = 0;
    QVector<CutStroke> m_strokes;
};

#endif // CUTMASK_H

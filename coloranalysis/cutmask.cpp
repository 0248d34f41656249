#include "cutmask.h"
#include "measurelog.h"

#include <QtMath>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

CutMask::CutMask(int width, int height)
    : m_width(qMax(0, width)),
    m_height(qMax(0, height))
{
}

bool CutMask::addStroke(const QVector<QPointF>& points, int brushWidth)
{
    if (points.size() < 2 || brushWidth < 1 || m_width == 0 || m_height == 0)
        return false;

    CutStroke s;
    s.points = points;
    s.width = brushWidth;
    m_strokes.push_back(s);
    qCDebug(lcDetect) << "cut stroke" << m_strokes.size() << "points" << points.size() << "width" << brushWidth;
    return true;
}

bool CutMask::undoStroke()
{
    if (m_strokes.isEmpty())
        return false;
    m_strokes.removeLast();
    return true;
}

void CutMask::clear()
{
    m_strokes.clear();
}

QVector<bool> CutMask::mask() const
{
    if (m_strokes.isEmpty())
        return QVector<bool>();

    // Все штрихи на одном холсте: их объединение
    cv::Mat canvas = cv::Mat::zeros(m_height, m_width, CV_8UC1);
    for (const auto& s : m_strokes) {
        for (int i = 1; i < s.points.size(); ++i) {
            const cv::Point a(qRound(s.points[i - 1].x()), qRound(s.points[i - 1].y()));
            const cv::Point b(qRound(s.points[i].x()), qRound(s.points[i].y()));
            cv::line(canvas, a, b, cv::Scalar(255), s.width, cv::LINE_8);
        }
    }

    QVector<bool> out(m_width * m_height, false);
    for (int y = 0; y < m_height; ++y) {
        const uchar* row = canvas.ptr<uchar>(y);
        for (int x = 0; x < m_width; ++x)
            out[y * m_width + x] = row[x] != 0;
    }
    return out;
}

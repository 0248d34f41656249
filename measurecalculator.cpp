#include "measurecalculator.h"

#include <QtMath>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

// ------------------------
// БЛОК 1. ГЕОМЕТРИЯ
// ------------------------

double MeasureCalculator::distance(const QPointF& p1, const QPointF& p2)
{
    return std::hypot(p2.x() - p1.x(), p2.y() - p1.y());
}

QPointF MeasureCalculator::midpoint(const QPointF& p1, const QPointF& p2)
{
    return (p1 + p2) / 2.0;
}

// ------------------------
// БЛОК 2. СТАТИСТИКА
// ------------------------

double MeasureCalculator::mean(const QVector<double>& values)
{
    if (values.isEmpty())
        return std::numeric_limits<double>::quiet_NaN();
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double MeasureCalculator::stddev(const QVector<double>& values, double m, int ddof)
{
    const int n = values.size();
    if (n - ddof <= 0)
        return 0.0;

    double sum = 0.0;
    for (double x : values) sum += qPow(x - m, 2);
    return qSqrt(sum / (n - ddof));
}

SampleStatistics MeasureCalculator::describe(const QVector<double>& values)
{
    SampleStatistics s;
    s.count = values.size();
    if (values.isEmpty())
        return s;

    s.mean = mean(values);
    s.std  = values.size() > 1 ? stddev(values, s.mean, 1) : 0.0;

    const auto [mn, mx] = std::minmax_element(values.begin(), values.end());
    s.min = *mn;
    s.max = *mx;
    return s;
}

int MeasureCalculator::distinctCount(const QVector<double>& values)
{
    QVector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    return static_cast<int>(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
}

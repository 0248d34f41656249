#ifndef TYPEMEASUREMENT_H
#define TYPEMEASUREMENT_H

#include <QVector>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <limits>

// ─────────────────────────────────────────────────────
// Общие константы
// ─────────────────────────────────────────────────────
namespace MeasureConst {
constexpr int    kNoGroup          = -1;   // sentinel: измерение вне групп
constexpr int    kAllGroups        = -2;   // фильтр выборки: все измерения
constexpr int    kCurveSamples     = 200;  // точек на кривой аппроксимации
constexpr int    kMinAutoBins      = 5;    // нижняя граница автоматического числа столбцов
constexpr int    kFitMaxIterations = 100;  // предел итераций Левенберга-Марквардта
constexpr double kMinClickDistance = 1.0;  // px, более близкий второй клик отклоняется
constexpr double kMinGroupDrag     = 3.0;  // px, рамка меньше игнорируется
constexpr int    kMilestone        = 50;   // уведомление каждые N измерений
}

// Одно измерение диаметра частицы
struct Measurement {
    int     id = 0;                 // последовательный, не переиспользуется
    QPointF p1;                     // концы отрезка в пикселях изображения
    QPointF p2;
    double  pixelDistance = 0.0;    // длина отрезка, px
    double  physicalValue = 0.0;    // pixelDistance * масштаб, всегда в Å
    int     groupId = MeasureConst::kNoGroup;

    QPointF center() const { return (p1 + p2) / 2.0; }
    bool hasGroup() const { return groupId != MeasureConst::kNoGroup; }
};

// Прямоугольная группа измерений
struct MeasurementGroup {
    int     groupId = 0;
    QRectF  bounds;                 // нормализованный прямоугольник, px
    QString label;

    // Границы включаются (как и в исходной рамке выделения)
    bool contains(const QPointF& pt) const
    {
        return pt.x() >= bounds.left() && pt.x() <= bounds.right()
            && pt.y() >= bounds.top()  && pt.y() <= bounds.bottom();
    }
};

// Описательная статистика по набору значений
struct SampleStatistics {
    int    count = 0;
    double mean  = std::numeric_limits<double>::quiet_NaN();
    double std   = std::numeric_limits<double>::quiet_NaN();  // выборочное (n-1), 0 для одного значения
    double min   = std::numeric_limits<double>::quiet_NaN();
    double max   = std::numeric_limits<double>::quiet_NaN();
};

using MeasurementList = QVector<Measurement>;
using GroupList       = QVector<MeasurementGroup>;

#endif // TYPEMEASUREMENT_H

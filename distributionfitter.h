#ifndef DISTRIBUTIONFITTER_H
#define DISTRIBUTIONFITTER_H

#include <QVector>
#include <QPointF>
#include <QString>
#include <limits>
#include "measureerror.h"

enum class FitMethod {
    LeastSquares,       // Левенберг-Марквардт по столбцам гистограммы
    MaximumLikelihood   // μ = среднее, σ = смещённое отклонение
};

// Гистограмма + параметры Гаусса + кривая для наложения
struct DistributionFit {
    QVector<double> binEdges;          // binCount + 1
    QVector<int>    binCounts;
    double          binWidth   = 0.0;
    int             totalCount = 0;

    double          sampleMean = std::numeric_limits<double>::quiet_NaN();
    double          sampleStd  = std::numeric_limits<double>::quiet_NaN();  // n-1
    double          minValue   = std::numeric_limits<double>::quiet_NaN();
    double          maxValue   = std::numeric_limits<double>::quiet_NaN();

    double          mean = std::numeric_limits<double>::quiet_NaN();       // аппроксимация
    double          std  = std::numeric_limits<double>::quiet_NaN();
    FitMethod       method     = FitMethod::LeastSquares;
    bool            converged  = false;
    int             iterations = 0;

    QVector<QPointF> curve;            // 200 точек на [min, max]; пусто без сходимости

    int binCount() const { return binCounts.size(); }
    double binCenter(int i) const { return (binEdges[i] + binEdges[i + 1]) / 2.0; }
    int maxBinCount() const;
};

/*
 * Распределение размеров: гистограмма и аппроксимация Гауссом.
 * Нечисловые значения (NaN, inf) отбрасываются.
 */
class DistributionFitter
{
public:
    // InsufficientData: меньше 2 значений, DegenerateDistribution: все равны,
    // FitDidNotConverge: гистограмма заполнена, кривой нет.
    // binCount <= 0 → autoBinCount(n)
    static MeasureError fit(const QVector<double>& values, int binCount,
                            DistributionFit* out, FitMethod method = FitMethod::LeastSquares);

    // Только гистограмма и выборочные параметры
    static MeasureError histogram(const QVector<double>& values, int binCount, DistributionFit* out);

    // max(5, floor(sqrt(n)))
    static int autoBinCount(int n);

    static double gaussianPdf(double x, double mean, double std);

    // Имя метода для экспорта
    static QString methodName(FitMethod method);

private:
    static bool fitLeastSquares(DistributionFit& f);
    static void fitMaximumLikelihood(DistributionFit& f, const QVector<double>& values);
    static void sampleCurve(DistributionFit& f);
};

#endif // DISTRIBUTIONFITTER_H

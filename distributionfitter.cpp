#include "distributionfitter.h"
#include "measurecalculator.h"
#include "typemeasurement.h"
#include "measurelog.h"

#include <Eigen/Dense>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace {
constexpr double kStepTolerance = 1e-10;   // относительный шаг параметров
constexpr double kSseTolerance  = 1e-14;   // относительное изменение суммы квадратов
constexpr int    kDampingTries  = 12;      // попыток увеличить λ на одной итерации
}

int DistributionFit::maxBinCount() const
{
    return binCounts.isEmpty() ? 0 : *std::max_element(binCounts.begin(), binCounts.end());
}

// ------------------------
// Публичные
// ------------------------
MeasureError DistributionFitter::fit(const QVector<double>& values, int binCount,
                                     DistributionFit* out, FitMethod method)
{
    DistributionFit f;
    f.method = method;

    QVector<double> clean;
    clean.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) clean.push_back(v);
    }

    const MeasureError err = histogram(clean, binCount, &f);
    if (err != MeasureError::None) {
        if (out) *out = f;
        return err;
    }

    if (method == FitMethod::MaximumLikelihood) {
        fitMaximumLikelihood(f, clean);
    } else if (!fitLeastSquares(f)) {
        qCWarning(lcFit) << "least squares did not converge after" << f.iterations << "iterations";
        f.converged = false;
        f.mean = std::numeric_limits<double>::quiet_NaN();
        f.std  = std::numeric_limits<double>::quiet_NaN();
        if (out) *out = f;
        return MeasureError::FitDidNotConverge;
    }

    f.converged = true;
    sampleCurve(f);

    qCDebug(lcFit) << methodName(method) << "mu =" << f.mean << "sigma =" << f.std
                   << "bins =" << f.binCount() << "n =" << f.totalCount;

    if (out) *out = f;
    return MeasureError::None;
}

MeasureError DistributionFitter::histogram(const QVector<double>& values, int binCount,
                                           DistributionFit* out)
{
    QVector<double> clean;
    clean.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) clean.push_back(v);
    }

    if (clean.size() < 2)
        return MeasureError::InsufficientData;

    const auto [mn, mx] = std::minmax_element(clean.begin(), clean.end());
    const double lo = *mn;
    const double hi = *mx;
    if (!(hi > lo))
        return MeasureError::DegenerateDistribution;

    DistributionFit local;
    DistributionFit& f = out ? *out : local;
    const int bins = binCount > 0 ? binCount : autoBinCount(clean.size());

    const SampleStatistics s = MeasureCalculator::describe(clean);
    f.sampleMean = s.mean;
    f.sampleStd  = s.std;
    f.minValue   = lo;
    f.maxValue   = hi;
    f.totalCount = clean.size();
    f.binWidth   = (hi - lo) / bins;

    f.binEdges.resize(bins + 1);
    for (int i = 0; i < bins; ++i)
        f.binEdges[i] = lo + i * f.binWidth;
    f.binEdges[bins] = hi;

    f.binCounts.fill(0, bins);
    for (double v : clean) {
        int idx = static_cast<int>(std::floor((v - lo) / f.binWidth));
        idx = qBound(0, idx, bins - 1);   // правый край последнего столбца включается
        ++f.binCounts[idx];
    }
    return MeasureError::None;
}

int DistributionFitter::autoBinCount(int n)
{
    if (n <= 0)
        return MeasureConst::kMinAutoBins;
    return std::max(MeasureConst::kMinAutoBins, static_cast<int>(std::floor(std::sqrt(double(n)))));
}

double DistributionFitter::gaussianPdf(double x, double mean, double std)
{
    if (!(std > 0.0))
        return 0.0;
    const double z = (x - mean) / std;
    return std::exp(-0.5 * z * z) / (std * std::sqrt(2.0 * M_PI));
}

QString DistributionFitter::methodName(FitMethod method)
{
    return method == FitMethod::MaximumLikelihood ? QStringLiteral("Maximum Likelihood")
                                                  : QStringLiteral("Least Squares");
}

// ------------------------
// Приватные
// ------------------------

// Левенберг-Марквардт по (μ, σ): Σ(count_i − A·N(c_i; μ, σ))², A = totalCount·binWidth
bool DistributionFitter::fitLeastSquares(DistributionFit& f)
{
    const int nBins = f.binCount();
    const double amp = f.totalCount * f.binWidth;

    auto sumSquares = [&](const Eigen::Vector2d& p) {
        double sse = 0.0;
        for (int i = 0; i < nBins; ++i) {
            const double r = f.binCounts[i] - amp * gaussianPdf(f.binCenter(i), p(0), p(1));
            sse += r * r;
        }
        return sse;
    };

    Eigen::Vector2d p(f.sampleMean, f.sampleStd);
    if (!p.allFinite() || p(1) <= 0.0)
        return false;

    double lambda = 0.01;
    double currentSSE = sumSquares(p);
    bool converged = false;

    Eigen::MatrixXd J(nBins, 2);
    Eigen::VectorXd r(nBins);

    int iter = 0;
    for (; iter < MeasureConst::kFitMaxIterations && !converged; ++iter) {
        const double mu = p(0);
        const double sigma = p(1);

        // аналитический якобиан модели
        for (int i = 0; i < nBins; ++i) {
            const double d  = f.binCenter(i) - mu;
            const double fx = amp * gaussianPdf(f.binCenter(i), mu, sigma);
            J(i, 0) = fx * d / (sigma * sigma);
            J(i, 1) = fx * (d * d / (sigma * sigma * sigma) - 1.0 / sigma);
            r(i)    = f.binCounts[i] - fx;
        }

        const Eigen::Matrix2d H = J.transpose() * J;
        const Eigen::Vector2d g = J.transpose() * r;
        if (g.cwiseAbs().maxCoeff() <= 1e-14 * (1.0 + currentSSE)) {
            converged = true;
            break;
        }

        bool accepted = false;
        for (int tryIter = 0; tryIter < kDampingTries; ++tryIter) {
            Eigen::Matrix2d Hlm = H;
            for (int k = 0; k < 2; ++k) Hlm(k, k) += lambda * (1.0 + std::abs(H(k, k)));

            const Eigen::Vector2d delta = Hlm.ldlt().solve(g);
            if (!delta.allFinite())
                return false;

            const bool tinyStep = std::abs(delta(0)) <= kStepTolerance * (std::abs(mu) + kStepTolerance)
                               && std::abs(delta(1)) <= kStepTolerance * (sigma + kStepTolerance);
            if (tinyStep) {
                converged = true;
                break;
            }

            const Eigen::Vector2d trial = p + delta;
            const double newSSE = trial(1) > 0.0 ? sumSquares(trial)
                                                 : std::numeric_limits<double>::infinity();
            if (std::isfinite(newSSE) && newSSE < currentSSE) {
                const double gain = currentSSE - newSSE;
                p = trial;
                currentSSE = newSSE;
                lambda /= 10.0;
                accepted = true;
                if (gain <= kSseTolerance * (currentSSE + kSseTolerance))
                    converged = true;
                break;
            }
            lambda *= 10.0;
        }

        if (!accepted && !converged)
            break;
    }

    f.iterations = iter;
    if (!converged || !p.allFinite() || !(p(1) > 0.0))
        return false;

    f.mean = p(0);
    f.std  = p(1);
    return true;
}

void DistributionFitter::fitMaximumLikelihood(DistributionFit& f, const QVector<double>& values)
{
    f.mean = MeasureCalculator::mean(values);
    f.std  = MeasureCalculator::stddev(values, f.mean, 0);
    f.iterations = 0;
}

void DistributionFitter::sampleCurve(DistributionFit& f)
{
    const int n = MeasureConst::kCurveSamples;
    const double amp = f.totalCount * f.binWidth;
    const double step = (f.maxValue - f.minValue) / (n - 1);

    f.curve.clear();
    f.curve.reserve(n);
    for (int i = 0; i < n; ++i) {
        const double x = (i == n - 1) ? f.maxValue : f.minValue + i * step;
        f.curve.push_back(QPointF(x, amp * gaussianPdf(x, f.mean, f.std)));
    }
}

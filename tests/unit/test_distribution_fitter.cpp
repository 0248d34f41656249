#include <gtest/gtest.h>
#include "distributionfitter.h"
#include "typemeasurement.h"

#include <cmath>
#include <limits>
#include <numeric>

namespace {

// Квантиль стандартного нормального распределения (бисекция по erfc)
double normalQuantile(double p) {
    double lo = -10.0, hi = 10.0;
    for (int i = 0; i < 200; ++i) {
        const double mid = 0.5 * (lo + hi);
        const double cdf = 0.5 * std::erfc(-mid / std::sqrt(2.0));
        if (cdf < p) lo = mid; else hi = mid;
    }
    return 0.5 * (lo + hi);
}

// Детерминированная «идеальная» выборка N(mean, std)
QVector<double> normalSample(int n, double mean, double std) {
    QVector<double> v;
    v.reserve(n);
    for (int i = 0; i < n; ++i)
        v.push_back(mean + std * normalQuantile((i + 0.5) / n));
    return v;
}

const QVector<double> kFive = {8.0, 9.0, 10.0, 11.0, 12.0};

} // namespace

// =============================================================================
// Rejected input
// =============================================================================

TEST(DistributionFitterTest, DegenerateDistribution) {
    DistributionFit f;
    EXPECT_EQ(DistributionFitter::fit({10.0, 10.0, 10.0}, 0, &f), MeasureError::DegenerateDistribution);
    EXPECT_TRUE(f.curve.isEmpty());
}

TEST(DistributionFitterTest, InsufficientData) {
    DistributionFit f;
    EXPECT_EQ(DistributionFitter::fit({}, 0, &f), MeasureError::InsufficientData);
    EXPECT_EQ(DistributionFitter::fit({5.0}, 0, &f), MeasureError::InsufficientData);
    EXPECT_EQ(DistributionFitter::fit({5.0, std::numeric_limits<double>::quiet_NaN()}, 0, &f),
              MeasureError::InsufficientData);
}

TEST(DistributionFitterTest, NonFiniteValuesAreDropped) {
    QVector<double> v = kFive;
    v << std::numeric_limits<double>::quiet_NaN() << std::numeric_limits<double>::infinity();

    DistributionFit f;
    ASSERT_EQ(DistributionFitter::fit(v, 0, &f), MeasureError::None);
    EXPECT_EQ(f.totalCount, 5);
    EXPECT_DOUBLE_EQ(f.maxValue, 12.0);
}

// =============================================================================
// Histogram
// =============================================================================

TEST(DistributionFitterTest, AutoBinCount) {
    EXPECT_EQ(DistributionFitter::autoBinCount(0), MeasureConst::kMinAutoBins);
    EXPECT_EQ(DistributionFitter::autoBinCount(4), 5);
    EXPECT_EQ(DistributionFitter::autoBinCount(100), 10);
    EXPECT_EQ(DistributionFitter::autoBinCount(150), 12);
}

TEST(DistributionFitterTest, HistogramLayout) {
    DistributionFit f;
    ASSERT_EQ(DistributionFitter::histogram(kFive, 0, &f), MeasureError::None);

    ASSERT_EQ(f.binCount(), 5);
    ASSERT_EQ(f.binEdges.size(), 6);
    EXPECT_DOUBLE_EQ(f.binEdges.first(), 8.0);
    EXPECT_DOUBLE_EQ(f.binEdges.last(), 12.0);
    EXPECT_DOUBLE_EQ(f.binWidth, 0.8);
    for (int c : f.binCounts) EXPECT_EQ(c, 1);   // максимум попадает в последний столбец
    EXPECT_EQ(f.maxBinCount(), 1);
    EXPECT_DOUBLE_EQ(f.binCenter(0), 8.4);
}

TEST(DistributionFitterTest, ExplicitBinCount) {
    DistributionFit f;
    ASSERT_EQ(DistributionFitter::histogram(kFive, 2, &f), MeasureError::None);
    ASSERT_EQ(f.binCount(), 2);
    EXPECT_EQ(f.binCounts[0], 2);
    EXPECT_EQ(f.binCounts[1], 3);
    EXPECT_EQ(std::accumulate(f.binCounts.begin(), f.binCounts.end(), 0), 5);
}

// =============================================================================
// Fitting
// =============================================================================

TEST(DistributionFitterTest, LeastSquaresOnFiveValues) {
    DistributionFit f;
    ASSERT_EQ(DistributionFitter::fit(kFive, 0, &f), MeasureError::None);

    EXPECT_TRUE(f.converged);
    EXPECT_GE(f.mean, 8.0);
    EXPECT_LE(f.mean, 12.0);
    EXPECT_NEAR(f.mean, 10.0, 1e-3);
    EXPECT_GT(f.std, 0.0);
    EXPECT_LE(f.iterations, MeasureConst::kFitMaxIterations);
}

TEST(DistributionFitterTest, LeastSquaresRecoversNormal) {
    DistributionFit f;
    ASSERT_EQ(DistributionFitter::fit(normalSample(2000, 50.0, 5.0), 0, &f), MeasureError::None);
    EXPECT_NEAR(f.mean, 50.0, 0.25);
    EXPECT_NEAR(f.std, 5.0, 0.5);
}

TEST(DistributionFitterTest, MaximumLikelihood) {
    DistributionFit f;
    ASSERT_EQ(DistributionFitter::fit(kFive, 0, &f, FitMethod::MaximumLikelihood), MeasureError::None);

    EXPECT_EQ(f.method, FitMethod::MaximumLikelihood);
    EXPECT_DOUBLE_EQ(f.mean, 10.0);
    EXPECT_NEAR(f.std, std::sqrt(2.0), 1e-12);         // смещённая оценка
    EXPECT_NEAR(f.sampleStd, std::sqrt(2.5), 1e-12);   // выборочная
}

TEST(DistributionFitterTest, CurveSpansDataRange) {
    DistributionFit f;
    ASSERT_EQ(DistributionFitter::fit(kFive, 0, &f, FitMethod::MaximumLikelihood), MeasureError::None);

    ASSERT_EQ(f.curve.size(), MeasureConst::kCurveSamples);
    EXPECT_DOUBLE_EQ(f.curve.first().x(), 8.0);
    EXPECT_DOUBLE_EQ(f.curve.last().x(), 12.0);

    // y = N·Δ·pdf
    const QPointF p = f.curve[100];
    EXPECT_NEAR(p.y(), 5 * 0.8 * DistributionFitter::gaussianPdf(p.x(), f.mean, f.std), 1e-12);
}

TEST(DistributionFitterTest, GaussianPdf) {
    EXPECT_NEAR(DistributionFitter::gaussianPdf(0.0, 0.0, 1.0), 0.3989422804014327, 1e-15);
    EXPECT_DOUBLE_EQ(DistributionFitter::gaussianPdf(1.0, 0.0, 0.0), 0.0);
}

TEST(DistributionFitterTest, MethodNames) {
    EXPECT_EQ(DistributionFitter::methodName(FitMethod::LeastSquares), QStringLiteral("Least Squares"));
    EXPECT_EQ(DistributionFitter::methodName(FitMethod::MaximumLikelihood),
              QStringLiteral("Maximum Likelihood"));
}

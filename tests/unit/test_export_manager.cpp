#include <gtest/gtest.h>
#include "exportmanager.h"

#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

namespace {

QStringList lines(const QString& text) {
    return text.split('\n');
}

} // namespace

// =============================================================================
// Measurement CSV
// =============================================================================

TEST(ExportManagerTest, EndToEndValues) {
    MeasurementSession s;
    ASSERT_EQ(s.calibrate(100.0, 50.0, LengthUnit::Nanometer), MeasureError::None);
    ASSERT_EQ(s.addMeasurement({0, 0}, {20, 0}), MeasureError::None);

    DistributionFit fit;
    const MeasureError err = s.fitDistribution(&fit);
    ASSERT_EQ(err, MeasureError::InsufficientData);

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, &fit, err));

    ASSERT_GE(out.size(), 3);
    EXPECT_EQ(out[0], QStringLiteral("Raw Data"));
    EXPECT_EQ(out[1], QStringLiteral("#,Diameter (nm),Pixel Dist (px),X1,Y1,X2,Y2,Group"));
    EXPECT_EQ(out[2], QStringLiteral("1,10.000000,20.000000,0.000000,0.000000,20.000000,0.000000,"));

    EXPECT_TRUE(out.contains(QStringLiteral("Mean,10.000000")));
    EXPECT_TRUE(out.contains(QStringLiteral("Count,1")));
    EXPECT_TRUE(out.contains(QStringLiteral("Scale (nm/px),0.5000000")));
    EXPECT_TRUE(out.contains(QStringLiteral("Unit,nm")));
}

TEST(ExportManagerTest, SectionOrder) {
    MeasurementSession s;
    s.calibrate(100.0, 50.0, LengthUnit::Nanometer);
    s.addMeasurement({0, 0}, {20, 0});

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    const int raw   = out.indexOf("Raw Data");
    const int stats = out.indexOf("Statistics");
    const int gauss = out.indexOf("Gaussian Fit");
    const int curve = out.indexOf("Fit Curve");

    ASSERT_EQ(raw, 0);
    EXPECT_LT(raw, stats);
    EXPECT_LT(stats, gauss);
    EXPECT_LT(gauss, curve);

    // пустая строка перед каждой секцией, кроме первой
    EXPECT_TRUE(out[stats - 1].isEmpty());
    EXPECT_TRUE(out[gauss - 1].isEmpty());
    EXPECT_TRUE(out[curve - 1].isEmpty());
}

TEST(ExportManagerTest, MissingFitIsNotAvailable) {
    MeasurementSession s;
    s.calibrate(100.0, 50.0, LengthUnit::Nanometer);
    s.addMeasurement({0, 0}, {20, 0});

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    EXPECT_TRUE(out.contains(QStringLiteral("μ (Mean),N/A")));
    EXPECT_TRUE(out.contains(QStringLiteral("σ (Std Dev),N/A")));
    EXPECT_TRUE(out.contains(QStringLiteral("Method,N/A")));
    EXPECT_TRUE(out.contains(QStringLiteral("Status,InsufficientData")));

    // после заголовка кривой ничего, кроме завершающего перевода строки
    const int header = out.indexOf(QStringLiteral("X (nm),Y (Count)"));
    ASSERT_GE(header, 0);
    EXPECT_EQ(header, out.size() - 2);
    EXPECT_TRUE(out.last().isEmpty());
}

TEST(ExportManagerTest, FitSectionsWithCurve) {
    MeasurementSession s;
    s.calibrate(1.0, 1.0, LengthUnit::Nanometer);
    for (int len = 8; len <= 12; ++len)
        s.addMeasurement({0, 0}, {double(len), 0});

    DistributionFit fit;
    const MeasureError err = s.fitDistribution(&fit, 0, MeasureConst::kAllGroups, FitMethod::MaximumLikelihood);
    ASSERT_EQ(err, MeasureError::None);

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, &fit, err));
    EXPECT_TRUE(out.contains(QStringLiteral("μ (Mean),10.000000")));
    EXPECT_TRUE(out.contains(QStringLiteral("Method,Maximum Likelihood")));
    EXPECT_TRUE(out.contains(QStringLiteral("Status,OK")));

    const int header = out.indexOf(QStringLiteral("X (nm),Y (Count)"));
    ASSERT_GE(header, 0);
    EXPECT_EQ(out.size() - 1 - (header + 1), MeasureConst::kCurveSamples);
    EXPECT_TRUE(out[header + 1].startsWith(QStringLiteral("8.000000,")));
}

TEST(ExportManagerTest, FitScopeNamesTheFittedSample) {
    MeasurementSession s;
    s.calibrate(1.0, 1.0, LengthUnit::Nanometer);
    for (int len = 8; len <= 12; ++len)
        s.addMeasurement({0, 0}, {double(len), 0});
    s.addMeasurement({100, 100}, {130, 100});
    const MeasurementGroup g = s.createGroup(QRectF(-1, -1, 20, 2), "left");

    DistributionFit groupFit;
    const MeasureError err = s.fitDistribution(&groupFit, 0, g.groupId, FitMethod::MaximumLikelihood);
    ASSERT_EQ(err, MeasureError::None);

    const QStringList grouped = lines(ExportManager::buildMeasurementCsv(s, &groupFit, err, g.groupId));
    const int gauss = grouped.indexOf(QStringLiteral("Gaussian Fit"));
    ASSERT_GE(gauss, 0);
    EXPECT_EQ(grouped[gauss + 2], QStringLiteral("Fit Scope,Group: left"));
    EXPECT_TRUE(grouped.contains(QStringLiteral("μ (Mean),10.000000")));
    // сырые данные и общая статистика по-прежнему по всем измерениям
    EXPECT_TRUE(grouped.contains(QStringLiteral("Count,6")));

    const QStringList all = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    EXPECT_TRUE(all.contains(QStringLiteral("Fit Scope,All")));

    const QStringList ungrouped = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData,
                                                                           MeasureConst::kNoGroup));
    EXPECT_TRUE(ungrouped.contains(QStringLiteral("Fit Scope,Ungrouped")));
}

TEST(ExportManagerTest, GroupStatisticsBlocks) {
    MeasurementSession s;
    s.calibrate(100.0, 50.0, LengthUnit::Nanometer);
    s.addMeasurement({0, 0}, {20, 0});
    s.createGroup(QRectF(0, -5, 30, 10), "A");
    s.createGroup(QRectF(500, 500, 10, 10), "empty");

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    EXPECT_EQ(out[2], QStringLiteral("1,10.000000,20.000000,0.000000,0.000000,20.000000,0.000000,A"));

    const int a = out.indexOf(QStringLiteral("Group Statistics: A"));
    ASSERT_GE(a, 0);
    EXPECT_EQ(out[a + 2], QStringLiteral("Count,1"));
    EXPECT_EQ(out[a + 3], QStringLiteral("Mean,10.000000"));

    const int e = out.indexOf(QStringLiteral("Group Statistics: empty"));
    ASSERT_GE(e, 0);
    EXPECT_EQ(out[e + 2], QStringLiteral("Count,0"));
    EXPECT_EQ(out[e + 3], QStringLiteral("Mean,N/A"));
}

TEST(ExportManagerTest, SameInputSameText) {
    MeasurementSession s;
    s.calibrate(100.0, 50.0, LengthUnit::Nanometer);
    for (int i = 0; i < 6; ++i)
        s.addMeasurement({0, 0}, {10.0 + i * 3, 1.0 * i});

    DistributionFit fit;
    const MeasureError err = s.fitDistribution(&fit);
    EXPECT_EQ(ExportManager::buildMeasurementCsv(s, &fit, err),
              ExportManager::buildMeasurementCsv(s, &fit, err));
}

TEST(ExportManagerTest, SmallDisplayValuesKeepPrecision) {
    MeasurementSession s;
    ASSERT_EQ(s.calibrate(100.0, 61.728, LengthUnit::Nanometer), MeasureError::None);
    ASSERT_EQ(s.addMeasurement({0, 0}, {20, 0}), MeasureError::None);   // 12.3456 нм
    s.setDisplayUnit(LengthUnit::Centimeter);

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    ASSERT_EQ(out[1], QStringLiteral("#,Diameter (cm),Pixel Dist (px),X1,Y1,X2,Y2,Group"));

    const QStringList row = out[2].split(',');
    ASSERT_GE(row.size(), 2);
    bool ok = false;
    const double diameter = row[1].toDouble(&ok);
    ASSERT_TRUE(ok);
    EXPECT_NEAR(diameter / 12.3456e-7, 1.0, 1e-6);
    EXPECT_EQ(row[2], QStringLiteral("20.000000"));

    const int scaleRow = out.indexOf(QRegularExpression("^Scale \\(cm/px\\),.*"));
    ASSERT_GE(scaleRow, 0);
    const double scale = out[scaleRow].section(',', 1).toDouble(&ok);
    ASSERT_TRUE(ok);
    EXPECT_NEAR(scale / 0.61728e-7, 1.0, 1e-6);

    const int mean = out.indexOf(QRegularExpression("^Mean,.*"));
    ASSERT_GE(mean, 0);
    EXPECT_NEAR(out[mean].section(',', 1).toDouble() / 12.3456e-7, 1.0, 1e-6);
}

TEST(ExportManagerTest, FormattingOfLargeAndZeroValues) {
    MeasurementSession s;
    s.calibrate(1.0, 1.0, LengthUnit::Nanometer);
    s.addMeasurement({0, 0}, {1234.5, 0});

    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    EXPECT_EQ(out[2], QStringLiteral("1,1234.500000,1234.500000,0.000000,0.000000,1234.500000,0.000000,"));
}

TEST(ExportManagerTest, UncalibratedScaleIsNotAvailable) {
    MeasurementSession s;
    const QStringList out = lines(ExportManager::buildMeasurementCsv(s, nullptr, MeasureError::InsufficientData));
    EXPECT_TRUE(out.contains(QStringLiteral("Scale (nm/px),N/A")));
    EXPECT_TRUE(out.contains(QStringLiteral("Count,0")));
}

// =============================================================================
// Area CSV
// =============================================================================

TEST(ExportManagerTest, AreaCsvInPixels) {
    ParticleDetection d;
    d.width = 10;
    d.height = 10;
    d.areasPx = {12, 4};
    d.totalAreaPx = 16;
    d.coveragePercent = 16.0;

    const QStringList out = lines(ExportManager::buildAreaCsv(d, ScaleCalibration(), nullptr,
                                                              MeasureError::InsufficientData));
    EXPECT_EQ(out[1], QStringLiteral("#,Area (px²),Area (px²)"));
    EXPECT_EQ(out[2], QStringLiteral("1,12.000000,12"));
    EXPECT_TRUE(out.contains(QStringLiteral("Total Area (px²),16")));
    EXPECT_TRUE(out.contains(QStringLiteral("Coverage (%),16.000000")));
}

TEST(ExportManagerTest, AreaCsvCalibrated) {
    ParticleDetection d;
    d.width = 10;
    d.height = 10;
    d.areasPx = {8};
    d.totalAreaPx = 8;

    ScaleCalibration c;
    c.set(100.0, 50.0, LengthUnit::Nanometer);   // 0.5 nm/px

    const QStringList out = lines(ExportManager::buildAreaCsv(d, c, nullptr, MeasureError::InsufficientData));
    EXPECT_EQ(out[1], QStringLiteral("#,Area (nm²),Area (px²)"));
    EXPECT_EQ(out[2], QStringLiteral("1,2.000000,8"));
    EXPECT_TRUE(out.contains(QStringLiteral("Scale (nm/px),0.5000000")));
}

// =============================================================================
// File output
// =============================================================================

TEST(ExportManagerTest, SaveWritesBom) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("out.csv");

    ExportManager exporter;
    QString saved;
    QObject::connect(&exporter, &ExportManager::exportSuccess, [&](const QString& p) { saved = p; });

    ASSERT_TRUE(exporter.saveToFile(path, QStringLiteral("Raw Data\n")));
    EXPECT_EQ(saved, path);

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QByteArray bytes = f.readAll();
    EXPECT_TRUE(bytes.startsWith(QByteArray("\xEF\xBB\xBF")));
    EXPECT_EQ(bytes.mid(3), QByteArray("Raw Data\n"));
}

TEST(ExportManagerTest, SaveFailureEmitsSignal) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    ExportManager exporter;
    bool failed = false;
    QObject::connect(&exporter, &ExportManager::exportFailure, [&](const QString&) { failed = true; });

    EXPECT_FALSE(exporter.saveToFile(dir.filePath("missing/dir/out.csv"), QStringLiteral("x")));
    EXPECT_TRUE(failed);
}

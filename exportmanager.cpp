#include "exportmanager.h"
#include "measurecalculator.h"
#include "measurelog.h"
#include "uistrings.h"

#include <QFile>
#include <QFileDialog>
#include <QTextStream>
#include <cmath>

namespace {
const QString kNotAvailable = QStringLiteral("N/A");
constexpr int kMinDecimals = 6;
constexpr int kMaxDecimals = 20;
const QString kFormula = QStringLiteral("f(x) = N·Δ·(1/(σ√(2π)))·exp(-(x-μ)²/(2σ²))");
}

ExportManager::ExportManager(QObject* parent) : QObject(parent) {}

// простая экранизация CSV
void ExportManager::writeCsvLine(QTextStream& out, const QStringList& cols, QChar sep)
{
    QStringList safe; safe.reserve(cols.size());
    for (QString s : cols) {
        if (s.contains('"')) s.replace("\"", "\"\"");
        if (s.contains(sep) || s.contains('\n') || s.contains('"')) s = "\"" + s + "\"";
        safe << s;
    }
    out << safe.join(sep) << "\n";
}

// Не меньше 6 знаков после точки и не меньше 7 значащих цифр (нм в см и т.п.)
QString ExportManager::formatValue(double v)
{
    if (qIsNaN(v) || qIsInf(v))
        return kNotAvailable;

    int decimals = kMinDecimals;
    if (v != 0.0) {
        const int exponent = static_cast<int>(std::floor(std::log10(std::abs(v))));
        decimals = qBound(kMinDecimals, kMinDecimals - exponent, kMaxDecimals);
    }
    return QString::number(v, 'f', decimals);
}

void ExportManager::writeStatistics(QTextStream& out, const SampleStatistics& s)
{
    writeCsvLine(out, {"Statistic", "Value"});
    writeCsvLine(out, {"Count",   QString::number(s.count)});
    writeCsvLine(out, {"Mean",    formatValue(s.mean)});
    writeCsvLine(out, {"Std Dev", formatValue(s.std)});
    writeCsvLine(out, {"Min",     formatValue(s.min)});
    writeCsvLine(out, {"Max",     formatValue(s.max)});
}

void ExportManager::writeFitSections(QTextStream& out, const DistributionFit* fit,
                                     MeasureError fitError, const QString& unit,
                                     const QString& scope)
{
    const bool hasFit = fit && fitError == MeasureError::None && fit->converged;

    // ───────────────────────────────────────────────────────────
    // СЕКЦИЯ 3. Параметры Гаусса
    // ───────────────────────────────────────────────────────────
    out << "\n";
    out << "Gaussian Fit\n";
    writeCsvLine(out, {"Parameter", "Value"});
    if (!scope.isEmpty())
        writeCsvLine(out, {"Fit Scope", scope});
    writeCsvLine(out, {"Formula",     kFormula});
    writeCsvLine(out, {"μ (Mean)",    hasFit ? formatValue(fit->mean) : kNotAvailable});
    writeCsvLine(out, {"σ (Std Dev)", hasFit ? formatValue(fit->std)  : kNotAvailable});
    writeCsvLine(out, {"Method",      hasFit ? DistributionFitter::methodName(fit->method) : kNotAvailable});
    writeCsvLine(out, {"Status",      hasFit ? QStringLiteral("OK") : errorName(fitError)});

    // ───────────────────────────────────────────────────────────
    // СЕКЦИЯ 4. Кривая аппроксимации
    // ───────────────────────────────────────────────────────────
    out << "\n";
    out << "Fit Curve\n";
    writeCsvLine(out, {QString("X (%1)").arg(unit), "Y (Count)"});
    if (hasFit) {
        for (const QPointF& p : fit->curve)
            writeCsvLine(out, {formatValue(p.x()), formatValue(p.y())});
    }
}

// ─────────────────────────────────────────────────────
// Измерения диаметров
// ─────────────────────────────────────────────────────
QString ExportManager::buildMeasurementCsv(const MeasurementSession& session,
                                           const DistributionFit* fit, MeasureError fitError,
                                           int fitGroupId)
{
    QString text;
    QTextStream out(&text);

    const ScaleCalibration& calib = session.calibration();
    const QString unit = session.unitSymbol();

    // ───────────────────────────────────────────────────────────
    // СЕКЦИЯ 1. Сырые данные (порядок добавления)
    // ───────────────────────────────────────────────────────────
    out << "Raw Data\n";
    writeCsvLine(out, {"#", QString("Diameter (%1)").arg(unit), "Pixel Dist (px)",
                       "X1", "Y1", "X2", "Y2", "Group"});

    int row = 0;
    for (const auto& m : session.store().measurements()) {
        writeCsvLine(out, {
                              QString::number(++row),
                              formatValue(session.displayValue(m)),
                              formatValue(m.pixelDistance),
                              formatValue(m.p1.x()), formatValue(m.p1.y()),
                              formatValue(m.p2.x()), formatValue(m.p2.y()),
                              session.groups().labelOf(m.groupId)
                          });
    }

    // ───────────────────────────────────────────────────────────
    // СЕКЦИЯ 2. Статистика (общая + по группам)
    // ───────────────────────────────────────────────────────────
    out << "\n";
    out << "Statistics\n";
    writeStatistics(out, session.statistics());
    writeCsvLine(out, {QString("Scale (%1/px)").arg(unit),
                       calib.isCalibrated() ? formatValue(calib.scaleFactor(calib.displayUnit())) : kNotAvailable});
    writeCsvLine(out, {"Unit", unit});

    for (const auto& g : session.groups().groups()) {
        SampleStatistics gs;
        // EmptyGroup даёт count = 0 и N/A в остальных строках
        if (session.groupStatistics(g.groupId, &gs) == MeasureError::NotFound)
            continue;
        out << "\n";
        writeCsvLine(out, {QString("Group Statistics: %1").arg(g.label)});
        writeStatistics(out, gs);
    }

    // Выборка аппроксимации: все измерения, вне групп или одна группа
    QString scope = QStringLiteral("All");
    if (fitGroupId == MeasureConst::kNoGroup)
        scope = QStringLiteral("Ungrouped");
    else if (fitGroupId != MeasureConst::kAllGroups)
        scope = QString("Group: %1").arg(session.groups().labelOf(fitGroupId));
    writeFitSections(out, fit, fitError, unit, scope);

    out.flush();
    return text;
}

// ─────────────────────────────────────────────────────
// Площади частиц (цветовой анализ)
// ─────────────────────────────────────────────────────
QString ExportManager::buildAreaCsv(const ParticleDetection& detection,
                                    const ScaleCalibration& calibration,
                                    const DistributionFit* fit, MeasureError fitError)
{
    QString text;
    QTextStream out(&text);

    const bool scaled = calibration.isCalibrated();
    const double pixelSize = scaled ? calibration.scaleFactor(calibration.displayUnit()) : 1.0;
    const QString unit = scaled ? unitSymbol(calibration.displayUnit()) + QChar(0x00B2)
                                : QStringLiteral("px²");
    const QVector<double> areas = ParticleDetector::physicalAreas(detection, pixelSize);

    out << "Raw Data\n";
    writeCsvLine(out, {"#", QString("Area (%1)").arg(unit), "Area (px²)"});
    for (int i = 0; i < detection.count(); ++i) {
        writeCsvLine(out, {QString::number(i + 1), formatValue(areas[i]),
                           QString::number(detection.areasPx[i])});
    }

    out << "\n";
    out << "Statistics\n";
    writeStatistics(out, MeasureCalculator::describe(areas));
    writeCsvLine(out, {"Total Area (px²)", QString::number(detection.totalAreaPx)});
    writeCsvLine(out, {"Coverage (%)", formatValue(detection.coveragePercent)});
    if (scaled) {
        writeCsvLine(out, {QString("Scale (%1/px)").arg(unitSymbol(calibration.displayUnit())),
                           formatValue(pixelSize)});
    }
    writeCsvLine(out, {"Unit", unit});

    writeFitSections(out, fit, fitError, unit);

    out.flush();
    return text;
}

// ─────────────────────────────────────────────────────
// Запись
// ─────────────────────────────────────────────────────
bool ExportManager::saveToFile(const QString& path, const QString& text)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcExport) << "cannot open" << path << f.errorString();
        emit exportFailure(f.errorString());
        return false;
    }

    QTextStream out(&f);
    out.setEncoding(QStringConverter::Utf8);
    out << QChar(0xFEFF); // BOM для Excel
    out << text;
    out.flush();

    if (out.status() != QTextStream::Ok) {
        qCWarning(lcExport) << "write failed" << path;
        emit exportFailure(f.errorString());
        return false;
    }

    f.close();
    qCInfo(lcExport) << "saved" << path;
    emit exportSuccess(path);
    return true;
}

bool ExportManager::exportCsv(QWidget* parent, const QString& text, const QString& suggestedName)
{
    const QString path = QFileDialog::getSaveFileName(
        parent, UiStrings::text("export_title"), suggestedName,
        UiStrings::text("csv_files") + " (*.csv)");
    if (path.isEmpty()) return false;

    return saveToFile(path, text);
}

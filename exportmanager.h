#ifndef EXPORTMANAGER_H
#define EXPORTMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "measurementsession.h"
#include "coloranalysis/particledetector.h"

// Экспорт в CSV. Секции: Raw Data, Statistics, Gaussian Fit, Fit Curve.
// Заголовки всегда на английском, без дат. Числа в фиксированной записи:
// не меньше 6 знаков после точки и не меньше 7 значащих цифр.
//
// ВАЖНО: Класс НИЧЕГО НЕ СЧИТАЕТ, кроме описательной статистики.
// Аппроксимация приходит готовой вместе с её статусом.

class QTextStream;
class QWidget;

class ExportManager : public QObject
{
    Q_OBJECT
public:
    explicit ExportManager(QObject* parent = nullptr);

    // Текст CSV для измерений сессии (единица отображения сессии).
    // fitGroupId: по какой выборке построена аппроксимация (строка Fit Scope)
    static QString buildMeasurementCsv(const MeasurementSession& session,
                                       const DistributionFit* fit, MeasureError fitError,
                                       int fitGroupId = MeasureConst::kAllGroups);

    // Текст CSV для площадей из цветового анализа
    static QString buildAreaCsv(const ParticleDetection& detection,
                                const ScaleCalibration& calibration,
                                const DistributionFit* fit, MeasureError fitError);

    // Запись UTF-8 с BOM
    bool saveToFile(const QString& path, const QString& text);

    // Диалог «Сохранить как…» + запись. false: отмена или ошибка
    bool exportCsv(QWidget* parent, const QString& text, const QString& suggestedName);

signals:
    void exportSuccess(const QString& path);
    void exportFailure(const QString& error);

private:
    static void writeCsvLine(QTextStream& out, const QStringList& cols, QChar sep = ',');
    static QString formatValue(double v);      // число или "N/A"
    static void writeStatistics(QTextStream& out, const SampleStatistics& s);
    static void writeFitSections(QTextStream& out, const DistributionFit* fit,
                                 MeasureError fitError, const QString& unit,
                                 const QString& scope = QString());
};

#endif // EXPORTMANAGER_H

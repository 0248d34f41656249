// settingsmanager.h
#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QMap>
#include <QAction>
#include <QActionGroup>
#include <QString>
#include "lengthunit.h"
#include "uistrings.h"
#include "typemeasurement.h"
#include "distributionfitter.h"
#include "coloranalysis/particledetector.h"

// ——— Настройки измерений ———
struct MeasureSettings {
    LengthUnit defaultUnit = LengthUnit::Nanometer;  // единица в диалоге масштаба
    int binCount = 0;                                // 0: авто
    FitMethod fitMethod = FitMethod::LeastSquares;

    double minClickDistance = MeasureConst::kMinClickDistance;  // px
    double minGroupDrag = MeasureConst::kMinGroupDrag;          // px
    int milestone = MeasureConst::kMilestone;                   // уведомление каждые N
};

// ——— Настройки цветового анализа ———
struct DetectionSettings {
    HsvTolerance tolerance;      // (15, 50, 50)
    int minArea = 10;            // px
    int overlayAlpha = 140;
};

// ——— Менеджер ———
class SettingsManager : public QObject {
    Q_OBJECT

public:
    explicit SettingsManager(QObject* parent = nullptr);

    // Пункты меню единиц и языка собираются в эксклюзивные группы
    void registerUnit(LengthUnit unit, QAction* action);
    void registerLanguage(UiLanguage language, QAction* action);

    // Отметить пункт без сигнала (например, после калибровки)
    void selectUnit(LengthUnit unit);

    LengthUnit displayUnit() const { return m_displayUnit; }
    UiLanguage language() const { return m_language; }

    // ——— Геттер/сеттер настроек измерений ———
    void setMeasureSettings(const MeasureSettings& settings);
    MeasureSettings measureSettings() const;

    // ——— Геттер/сеттер настроек цветового анализа ———
    void setDetectionSettings(const DetectionSettings& settings);
    DetectionSettings detectionSettings() const;

signals:
    void displayUnitChanged(LengthUnit unit);
    void languageChanged(UiLanguage language);

private slots:
    void onUnitSelected(QAction* action);
    void onLanguageSelected(QAction* action);

private:
    QMap<QAction*, LengthUnit> m_unitActions;
    QMap<QAction*, UiLanguage> m_languageActions;
    QActionGroup* m_unitGroup;
    QActionGroup* m_languageGroup;

    LengthUnit m_displayUnit = LengthUnit::Nanometer;
    UiLanguage m_language = UiLanguage::Russian;

    MeasureSettings m_measureSettings;
    DetectionSettings m_detectionSettings;
};

#endif // SETTINGSMANAGER_H

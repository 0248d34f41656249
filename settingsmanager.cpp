#include "settingsmanager.h"
#include <QActionGroup>

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent),
    m_unitGroup(new QActionGroup(this)),
    m_languageGroup(new QActionGroup(this))
{
    m_unitGroup->setExclusive(true);
    connect(m_unitGroup, &QActionGroup::triggered,
            this, &SettingsManager::onUnitSelected);

    m_languageGroup->setExclusive(true);
    connect(m_languageGroup, &QActionGroup::triggered,
            this, &SettingsManager::onLanguageSelected);

    m_language = UiStrings::language();
}

void SettingsManager::registerUnit(LengthUnit unit, QAction* action)
{
    m_unitActions.insert(action, unit);
    action->setActionGroup(m_unitGroup);
    action->setCheckable(true);
    action->setText(unitSymbol(unit));
    if (unit == m_displayUnit)
        action->setChecked(true);
}

void SettingsManager::registerLanguage(UiLanguage language, QAction* action)
{
    m_languageActions.insert(action, language);
    action->setActionGroup(m_languageGroup);
    action->setCheckable(true);
    action->setText(language == UiLanguage::Russian ? QStringLiteral("Русский")
                                                    : QStringLiteral("English"));
    if (language == m_language)
        action->setChecked(true);
}

void SettingsManager::selectUnit(LengthUnit unit)
{
    m_displayUnit = unit;
    for (auto it = m_unitActions.cbegin(); it != m_unitActions.cend(); ++it) {
        if (it.value() == unit) it.key()->setChecked(true);
    }
}

void SettingsManager::onUnitSelected(QAction* action)
{
    if (m_unitActions.contains(action)) {
        m_displayUnit = m_unitActions.value(action);
        emit displayUnitChanged(m_displayUnit);
    }
}

void SettingsManager::onLanguageSelected(QAction* action)
{
    if (m_languageActions.contains(action)) {
        m_language = m_languageActions.value(action);
        UiStrings::setLanguage(m_language);
        emit languageChanged(m_language);
    }
}

void SettingsManager::setMeasureSettings(const MeasureSettings& settings)
{
    m_measureSettings = settings;
}

MeasureSettings SettingsManager::measureSettings() const
{
    return m_measureSettings;
}

void SettingsManager::setDetectionSettings(const DetectionSettings& settings) {
    m_detectionSettings = settings;
}

DetectionSettings SettingsManager::detectionSettings() const {
    return m_detectionSettings;
}

#ifndef SCALECALIBRATION_H
#define SCALECALIBRATION_H

#include "lengthunit.h"
#include "measureerror.h"

// ─────────────────────────────────────────────────────
// Калибровка масштаба: пиксели → физическая длина.
// Масштаб хранится в Å/px; единица отображения влияет только на toDisplay().
// ─────────────────────────────────────────────────────
class ScaleCalibration
{
public:
    ScaleCalibration() = default;

    // Задать калибровку по отрезку на масштабной линейке.
    // InvalidScale, если любое значение не положительно или не конечно.
    // При успехе единица отображения становится равной unit.
    MeasureError set(double pixelDistance, double physicalLength, LengthUnit unit);

    // Пиксели → длина в Å. Uncalibrated, пока set() не прошёл успешно.
    MeasureError convert(double pixelValue, double* angstroms) const;

    bool isCalibrated() const { return m_calibrated; }
    void reset();

    // ——— Отображение ———
    void setDisplayUnit(LengthUnit unit) { m_displayUnit = unit; }
    LengthUnit displayUnit() const { return m_displayUnit; }

    double toDisplay(double angstroms) const;     // Å → единица отображения
    double fromDisplay(double displayValue) const; // единица отображения → Å

    // ——— Параметры калибровки ———
    LengthUnit unit() const { return m_unit; }             // единица, в которой вводилась длина
    double pixelDistance() const { return m_pixelDistance; }
    double physicalLength() const { return m_physicalLength; }

    // Длина одного пикселя в заданной единице (NaN без калибровки)
    double scaleFactor(LengthUnit unit) const;
    double scaleFactorAngstrom() const { return m_angstromPerPixel; }

private:
    bool       m_calibrated = false;
    double     m_pixelDistance = 0.0;
    double     m_physicalLength = 0.0;
    double     m_angstromPerPixel = 0.0;   // каноническая база
    LengthUnit m_unit = LengthUnit::Nanometer;
    LengthUnit m_displayUnit = LengthUnit::Nanometer;
};

#endif // SCALECALIBRATION_H

#include "scalecalibration.h"
#include "measurelog.h"

#include <cmath>
#include <limits>

MeasureError ScaleCalibration::set(double pixelDistance, double physicalLength, LengthUnit unit)
{
    if (!std::isfinite(pixelDistance) || !std::isfinite(physicalLength)
        || pixelDistance <= 0.0 || physicalLength <= 0.0) {
        qCWarning(lcSession) << "rejected scale" << pixelDistance << "px ="
                             << physicalLength << unitSymbol(unit);
        return MeasureError::InvalidScale;
    }

    const double factor = physicalLength * angstromsPerUnit(unit) / pixelDistance;
    if (!std::isfinite(factor) || factor <= 0.0)
        return MeasureError::InvalidScale;

    m_pixelDistance    = pixelDistance;
    m_physicalLength   = physicalLength;
    m_unit             = unit;
    m_displayUnit      = unit;
    m_angstromPerPixel = factor;
    m_calibrated       = true;

    qCInfo(lcSession) << "scale set:" << scaleFactor(unit) << unitSymbol(unit) << "/px";
    return MeasureError::None;
}

MeasureError ScaleCalibration::convert(double pixelValue, double* angstroms) const
{
    if (!m_calibrated)
        return MeasureError::Uncalibrated;
    if (angstroms)
        *angstroms = pixelValue * m_angstromPerPixel;
    return MeasureError::None;
}

void ScaleCalibration::reset()
{
    *this = ScaleCalibration();
}

double ScaleCalibration::toDisplay(double angstroms) const
{
    return convertLength(angstroms, LengthUnit::Angstrom, m_displayUnit);
}

double ScaleCalibration::fromDisplay(double displayValue) const
{
    return convertLength(displayValue, m_displayUnit, LengthUnit::Angstrom);
}

double ScaleCalibration::scaleFactor(LengthUnit unit) const
{
    if (!m_calibrated)
        return std::numeric_limits<double>::quiet_NaN();
    return convertLength(m_angstromPerPixel, LengthUnit::Angstrom, unit);
}

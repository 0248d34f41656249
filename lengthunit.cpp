#include "lengthunit.h"

double angstromsPerUnit(LengthUnit unit)
{
    switch (unit) {
    case LengthUnit::Angstrom:   return 1.0;
    case LengthUnit::Nanometer:  return 10.0;
    case LengthUnit::Micrometer: return 1.0e4;
    case LengthUnit::Millimeter: return 1.0e7;
    case LengthUnit::Centimeter: return 1.0e8;
    }
    return 1.0;
}

double convertLength(double value, LengthUnit from, LengthUnit to)
{
    if (from == to)
        return value;
    return value * angstromsPerUnit(from) / angstromsPerUnit(to);
}

QString unitSymbol(LengthUnit unit)
{
    switch (unit) {
    case LengthUnit::Angstrom:   return QStringLiteral("Å");
    case LengthUnit::Nanometer:  return QStringLiteral("nm");
    case LengthUnit::Micrometer: return QStringLiteral("μm");
    case LengthUnit::Millimeter: return QStringLiteral("mm");
    case LengthUnit::Centimeter: return QStringLiteral("cm");
    }
    return QString();
}

bool unitFromSymbol(const QString& symbol, LengthUnit* unit)
{
    const QString s = symbol.trimmed();
    for (LengthUnit u : allLengthUnits()) {
        if (unitSymbol(u) == s) {
            if (unit) *unit = u;
            return true;
        }
    }
    // "um" и "µ" (micro sign U+00B5) встречаются при ручном вводе
    if (s == QStringLiteral("um") || s == QStringLiteral("µm")) {
        if (unit) *unit = LengthUnit::Micrometer;
        return true;
    }
    return false;
}

QList<LengthUnit> allLengthUnits()
{
    return { LengthUnit::Angstrom, LengthUnit::Nanometer, LengthUnit::Micrometer,
             LengthUnit::Millimeter, LengthUnit::Centimeter };
}

QStringList allUnitSymbols()
{
    QStringList out;
    for (LengthUnit u : allLengthUnits())
        out << unitSymbol(u);
    return out;
}

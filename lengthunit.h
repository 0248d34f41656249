#ifndef LENGTHUNIT_H
#define LENGTHUNIT_H

#include <QString>
#include <QStringList>

// ─────────────────────────────────────────────────────
// Единицы длины (закрытый набор, порядок = порядок в меню)
// ─────────────────────────────────────────────────────
enum class LengthUnit {
    Angstrom,
    Nanometer,
    Micrometer,
    Millimeter,
    Centimeter
};

// Сколько ангстрем в одной единице. Å: каноническая (самая мелкая) единица хранения
double angstromsPerUnit(LengthUnit unit);

// Перевод значения между единицами
double convertLength(double value, LengthUnit from, LengthUnit to);

// "Å", "nm", "μm", "mm", "cm"
QString unitSymbol(LengthUnit unit);

// Обратный разбор символа; false, если символ не из набора
bool unitFromSymbol(const QString& symbol, LengthUnit* unit);

// Все единицы в порядке перечисления
QList<LengthUnit> allLengthUnits();
QStringList allUnitSymbols();

#endif // LENGTHUNIT_H

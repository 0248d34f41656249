#ifndef MEASURECALCULATOR_H
#define MEASURECALCULATOR_H

#include <QVector>
#include <QPointF>
#include "typemeasurement.h"

/*
 * Независимый калькулятор.
 * Никаких знаний о сессии/настройках: только "чистая математика".
 */
class MeasureCalculator
{
public:

    // ------------------------
    // БЛОК 1. ГЕОМЕТРИЯ
    // ------------------------

    // Евклидово расстояние между концами отрезка, px
    static double distance(const QPointF& p1, const QPointF& p2);

    // Середина отрезка
    static QPointF midpoint(const QPointF& p1, const QPointF& p2);

    // ------------------------
    // БЛОК 2. СТАТИСТИКА
    // ------------------------

    static double mean(const QVector<double>& values);

    // ddof = 1: выборочное отклонение, ddof = 0: смещённое (оценка МП)
    static double stddev(const QVector<double>& values, double mean, int ddof = 1);

    // count/mean/std/min/max; std = 0 для одного значения, NaN для пустого набора
    static SampleStatistics describe(const QVector<double>& values);

    // Количество различных значений (точное сравнение)
    static int distinctCount(const QVector<double>& values);
};

#endif // MEASURECALCULATOR_H

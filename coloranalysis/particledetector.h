#ifndef PARTICLEDETECTOR_H
#define PARTICLEDETECTOR_H

#include <QVector>
#include <QPointF>
#include <QImage>
#include <QColor>
#include "measureerror.h"

// HSV в шкалах H 0-180, S 0-255, V 0-255
struct HsvColor {
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;
};

struct HsvTolerance {
    int h = 15;
    int s = 50;
    int v = 50;
};

// Результат поиска частиц по цвету
struct ParticleDetection {
    int              width  = 0;
    int              height = 0;
    QVector<int>     labels;            // width*height, 0: фон, 1: самая крупная частица
    QVector<int>     areasPx;           // по убыванию
    QVector<QPointF> centroids;         // в пикселях изображения, в том же порядке
    int              totalAreaPx = 0;
    double           coveragePercent = 0.0;

    int count() const { return areasPx.size(); }
    bool isEmpty() const { return areasPx.isEmpty(); }
};

/*
 * Простой пороговый детектор на OpenCV: допуск по HSV вокруг среднего
 * выбранных цветов (cv::inRange), 4-связные компоненты
 * (cv::connectedComponentsWithStats), отсечение по минимальной площади.
 * Интерфейс на типах Qt, cv::Mat остаётся внутри реализации.
 */
class ParticleDetector
{
public:
    static HsvColor toHsv(QRgb rgb);

    // Средний цвет: круговое среднее по H, арифметическое по S и V
    static HsvColor centerColor(const QVector<QRgb>& colors);

    // Круговое расстояние по H (0..90)
    static double hueDistance(double h1, double h2);

    // (15, 50, 50) для одного цвета, иначе разброс * 1.5 + запас
    static HsvTolerance initialTolerance(const QVector<QRgb>& colors);

    // cutMask: пусто или width*height, true: пиксель вырезан вручную.
    // InsufficientData: нет цветов или пустое изображение
    static MeasureError detect(const QImage& image, const QVector<QRgb>& colors,
                               const HsvTolerance& tolerance, int minArea,
                               ParticleDetection* out,
                               const QVector<bool>& cutMask = QVector<bool>());

    // Площади в квадрате единицы; pixelSize: длина пикселя в этой единице
    static QVector<double> physicalAreas(const ParticleDetection& detection, double pixelSize);

    // Раскраска найденных частиц поверх изображения
    static QImage overlay(const QImage& image, const ParticleDetection& detection, int alpha = 140);
};

#endif // PARTICLEDETECTOR_H

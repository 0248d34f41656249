#ifndef HISTOGRAMCHART_H
#define HISTOGRAMCHART_H

#include <QObject>
#include <QLayout>
#include <QtCharts/QChartView>
#include <QtCharts/QLineSeries>
#include <QtCharts/QAreaSeries>
#include <QtCharts/QValueAxis>

#include "distributionfitter.h"

// Гистограмма (ступенчатая заливка) + кривая Гаусса на общих осях
class HistogramChart : public QObject
{
    Q_OBJECT
public:
    explicit HistogramChart(QLayout* layout, QObject* parent = nullptr);

    // err = FitDidNotConverge: гистограмма без кривой
    void draw(const DistributionFit& fit, MeasureError err,
              const QString& title, const QString& xTitle);

    // Пустой график с сообщением в заголовке
    void clear(const QString& message);

    void setLegendNames(const QString& histName, const QString& fitName);

private:
    QChart* m_chart;
    QChartView* m_chartView;
    QLineSeries* m_stepSeries;
    QAreaSeries* m_histSeries;
    QLineSeries* m_fitSeries;
    QValueAxis* m_axisX;
    QValueAxis* m_axisY;
};

#endif // HISTOGRAMCHART_H

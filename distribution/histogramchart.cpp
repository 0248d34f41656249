#include "histogramchart.h"
#include "uistrings.h"

#include <QPen>
#include <QtMath>

HistogramChart::HistogramChart(QLayout* layout, QObject* parent)
    : QObject(parent)
{
    m_chart = new QChart();
    m_stepSeries = new QLineSeries();
    m_histSeries = new QAreaSeries(m_stepSeries);
    m_fitSeries = new QLineSeries();
    m_axisX = new QValueAxis();
    m_axisY = new QValueAxis();

    m_histSeries->setBrush(QColor(70, 130, 180, 160));
    m_histSeries->setPen(QPen(QColor(30, 30, 30), 1));
    m_fitSeries->setPen(QPen(QColor(220, 20, 60), 2));

    m_chart->addSeries(m_histSeries);
    m_chart->addSeries(m_fitSeries);
    m_chart->addAxis(m_axisX, Qt::AlignBottom);
    m_chart->addAxis(m_axisY, Qt::AlignLeft);
    m_histSeries->attachAxis(m_axisX);
    m_histSeries->attachAxis(m_axisY);
    m_fitSeries->attachAxis(m_axisX);
    m_fitSeries->attachAxis(m_axisY);
    m_chart->legend()->setAlignment(Qt::AlignTop);

    m_chartView = new QChartView(m_chart);
    m_chartView->setRenderHint(QPainter::Antialiasing);
    layout->addWidget(m_chartView);
}

void HistogramChart::setLegendNames(const QString& histName, const QString& fitName)
{
    m_histSeries->setName(histName);
    m_fitSeries->setName(fitName);
}

void HistogramChart::draw(const DistributionFit& fit, MeasureError err,
                          const QString& title, const QString& xTitle)
{
    m_stepSeries->clear();
    m_fitSeries->clear();

    // Ступени: (e0,0) (e0,c0) (e1,c0) (e1,c1) ... (eN,0)
    QList<QPointF> steps;
    for (int i = 0; i < fit.binCount(); ++i) {
        steps << QPointF(fit.binEdges[i], i == 0 ? 0.0 : fit.binCounts[i - 1])
              << QPointF(fit.binEdges[i], fit.binCounts[i]);
    }
    if (fit.binCount() > 0) {
        steps << QPointF(fit.binEdges.last(), fit.binCounts.last())
              << QPointF(fit.binEdges.last(), 0.0);
    }
    m_stepSeries->replace(steps);

    double maxY = fit.maxBinCount();
    if (err == MeasureError::None) {
        m_fitSeries->replace(fit.curve);
        for (const QPointF& p : fit.curve) maxY = qMax(maxY, p.y());
    }
    m_fitSeries->setVisible(err == MeasureError::None);

    // Ось X: диапазон гистограммы, Ось Y: от нуля с запасом
    if (fit.binCount() > 0) {
        const double pad = fit.binWidth * 0.5;
        m_axisX->setRange(fit.binEdges.first() - pad, fit.binEdges.last() + pad);
    }
    m_axisX->setTitleText(xTitle);
    m_axisX->setLabelFormat("%.3g");
    m_axisY->setRange(0.0, qMax(1.0, std::ceil(maxY * 1.1)));
    m_axisY->setLabelFormat("%d");
    m_axisY->setTitleText(UiStrings::text("hist_ylabel"));

    m_chart->setTitle(title);
}

void HistogramChart::clear(const QString& message)
{
    m_stepSeries->clear();
    m_fitSeries->clear();
    m_axisX->setRange(0.0, 1.0);
    m_axisY->setRange(0.0, 1.0);
    m_chart->setTitle(message);
}

#ifndef COLORANALYSISWINDOW_H
#define COLORANALYSISWINDOW_H

#include <QMainWindow>
#include <QImage>
#include <QVector>
#include "coloranalysis/particledetector.h"
#include "coloranalysis/cutmask.h"
#include "scalecalibration.h"
#include "distributionfitter.h"
#include "settingsmanager.h"

class QLabel;
class QGroupBox;
class QSlider;
class QSpinBox;
class QPushButton;
class QTableWidget;
class QHBoxLayout;
class QTimer;
class QEvent;
class QPainter;
class HistogramChart;
class ExportManager;

// ─────────────────────────────────────────────────────
// Цветовой анализ: частицы по порогу HSV вокруг выбранных цветов,
// площади, покрытие, распределение площадей и экспорт.
// ─────────────────────────────────────────────────────
class ColorAnalysisWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit ColorAnalysisWindow(const QImage& image, QWidget* parent = nullptr);

    void setCalibration(const ScaleCalibration& calibration);
    void setDetectionSettings(const DetectionSettings& settings);
    DetectionSettings detectionSettings() const;

    // Цвет, выбранный кликом по изображению
    void addColor(QRgb color);

    const ParticleDetection& detection() const { return m_detection; }

public slots:
    void retranslate();

signals:
    void colorPickRequested();                         // выбрать ещё один цвет на изображении
    void settingsChanged(const DetectionSettings& settings);

private slots:
    void onRemoveColor();
    void onAutoTolerance();
    void onParametersChanged();
    void runDetection();
    void onExportClicked();
    void onSplitModeToggled(bool on);
    void onUndoSplit();
    void onClearSplits();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void buildUi();
    void updatePreview();
    void updateSplitButtons();
    bool toImagePoint(const QPoint& labelPos, QPointF* out) const;
    void paintStroke(QPainter& painter, const QVector<QPointF>& points, int width) const;
    void drawSwatches();
    void drawResults();
    QString areaUnit() const;

    QImage m_image;
    CutMask m_cuts;
    ScaleCalibration m_calibration;
    QVector<QRgb> m_colors;
    ParticleDetection m_detection;
    DistributionFit m_fit;
    MeasureError m_fitError = MeasureError::InsufficientData;

    // Виджеты
    QLabel* m_colorsLabel = nullptr;
    QHBoxLayout* m_swatchLayout = nullptr;
    QPushButton* m_addColorButton = nullptr;
    QPushButton* m_removeColorButton = nullptr;
    QPushButton* m_autoTolButton = nullptr;
    QGroupBox* m_tolBox = nullptr;
    QLabel* m_hLabel = nullptr;
    QLabel* m_sLabel = nullptr;
    QLabel* m_vLabel = nullptr;
    QLabel* m_minAreaLabel = nullptr;
    QSlider* m_hSlider = nullptr;
    QSlider* m_sSlider = nullptr;
    QSlider* m_vSlider = nullptr;
    QSpinBox* m_minAreaSpin = nullptr;
    QPushButton* m_detectButton = nullptr;
    QPushButton* m_exportButton = nullptr;
    QLabel* m_preview = nullptr;
    QPushButton* m_splitButton = nullptr;
    QLabel* m_brushLabel = nullptr;
    QSpinBox* m_brushSpin = nullptr;
    QPushButton* m_undoSplitButton = nullptr;
    QPushButton* m_clearSplitsButton = nullptr;
    QLabel* m_splitHint = nullptr;
    QLabel* m_countLabel = nullptr;
    QLabel* m_areaLabel = nullptr;
    QLabel* m_coverageLabel = nullptr;
    QTableWidget* m_table = nullptr;
    HistogramChart* m_chart = nullptr;
    QTimer* m_debounce = nullptr;
    ExportManager* m_exportManager = nullptr;
    int m_overlayAlpha = 140;

    // Разрез, рисуемый сейчас (координаты изображения)
    bool m_drawingStroke = false;
    QVector<QPointF> m_strokePoints;
    QImage m_previewBase;          // превью без текущего штриха, в масштабе экрана
};

#endif // COLORANALYSISWINDOW_H

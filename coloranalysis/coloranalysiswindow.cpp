#include "coloranalysiswindow.h"
#include "distribution/histogramchart.h"
#include "exportmanager.h"
#include "uistrings.h"
#include "lengthunit.h"

#include <QLabel>
#include <QSlider>
#include <QSpinBox>
#include <QPushButton>
#include <QTableWidget>
#include <QHeaderView>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QSplitter>
#include <QTimer>
#include <QMessageBox>
#include <QPixmap>
#include <QPainter>
#include <QMouseEvent>

namespace {
constexpr int kPreviewMax = 600;   // px, большая сторона превью
constexpr int kDebounceMs = 150;
const QColor kCutColor(255, 48, 48);
}

ColorAnalysisWindow::ColorAnalysisWindow(const QImage& image, QWidget* parent)
    : QMainWindow(parent),
    m_image(image.convertToFormat(QImage::Format_RGB32)),
    m_cuts(m_image.width(), m_image.height()),
    m_debounce(new QTimer(this)),
    m_exportManager(new ExportManager(this))
{
    buildUi();

    m_debounce->setSingleShot(true);
    m_debounce->setInterval(kDebounceMs);
    connect(m_debounce, &QTimer::timeout, this, &ColorAnalysisWindow::runDetection);

    connect(m_exportManager, &ExportManager::exportSuccess, this, [=](const QString& path) {
        QMessageBox::information(this, UiStrings::text("export_title"), UiStrings::text("exported").arg(path));
    });
    connect(m_exportManager, &ExportManager::exportFailure, this, [=](const QString& error) {
        QMessageBox::warning(this, UiStrings::text("error"), UiStrings::text("export_fail").arg(error));
    });

    retranslate();
    resize(1000, 760);
}

// ─────────────────────────────────────────────────────
// Построение окна (без .ui: набор слайдеров зависит от данных)
// ─────────────────────────────────────────────────────
void ColorAnalysisWindow::buildUi()
{
    auto* central = new QWidget(this);
    auto* root = new QVBoxLayout(central);

    // ——— Цвета ———
    auto* colorsRow = new QHBoxLayout();
    m_colorsLabel = new QLabel(central);
    m_swatchLayout = new QHBoxLayout();
    m_addColorButton = new QPushButton(central);
    m_removeColorButton = new QPushButton(central);
    m_autoTolButton = new QPushButton(central);
    colorsRow->addWidget(m_colorsLabel);
    colorsRow->addLayout(m_swatchLayout);
    colorsRow->addStretch();
    colorsRow->addWidget(m_addColorButton);
    colorsRow->addWidget(m_removeColorButton);
    colorsRow->addWidget(m_autoTolButton);
    root->addLayout(colorsRow);

    // ——— Допуски ———
    m_tolBox = new QGroupBox(central);
    QGroupBox* tolBox = m_tolBox;
    auto* grid = new QGridLayout(tolBox);
    m_hLabel = new QLabel(tolBox);
    m_sLabel = new QLabel(tolBox);
    m_vLabel = new QLabel(tolBox);
    m_minAreaLabel = new QLabel(tolBox);

    auto makeSlider = [tolBox](int maxValue) {
        auto* s = new QSlider(Qt::Horizontal, tolBox);
        s->setRange(0, maxValue);
        return s;
    };
    m_hSlider = makeSlider(90);
    m_sSlider = makeSlider(128);
    m_vSlider = makeSlider(128);

    m_minAreaSpin = new QSpinBox(tolBox);
    m_minAreaSpin->setRange(0, 100000);

    auto* hValue = new QLabel(tolBox);
    auto* sValue = new QLabel(tolBox);
    auto* vValue = new QLabel(tolBox);
    connect(m_hSlider, &QSlider::valueChanged, hValue, QOverload<int>::of(&QLabel::setNum));
    connect(m_sSlider, &QSlider::valueChanged, sValue, QOverload<int>::of(&QLabel::setNum));
    connect(m_vSlider, &QSlider::valueChanged, vValue, QOverload<int>::of(&QLabel::setNum));

    grid->addWidget(m_hLabel, 0, 0);  grid->addWidget(m_hSlider, 0, 1);  grid->addWidget(hValue, 0, 2);
    grid->addWidget(m_sLabel, 1, 0);  grid->addWidget(m_sSlider, 1, 1);  grid->addWidget(sValue, 1, 2);
    grid->addWidget(m_vLabel, 2, 0);  grid->addWidget(m_vSlider, 2, 1);  grid->addWidget(vValue, 2, 2);
    grid->addWidget(m_minAreaLabel, 3, 0); grid->addWidget(m_minAreaSpin, 3, 1);
    root->addWidget(tolBox);

    // ——— Превью | результаты ———
    auto* splitter = new QSplitter(Qt::Horizontal, central);

    m_preview = new QLabel(splitter);
    m_preview->setAlignment(Qt::AlignCenter);
    m_preview->setMinimumSize(320, 240);
    m_preview->setStyleSheet("background-color: #222222;");

    auto* right = new QWidget(splitter);
    auto* rightLayout = new QVBoxLayout(right);
    m_countLabel = new QLabel(right);
    m_areaLabel = new QLabel(right);
    m_coverageLabel = new QLabel(right);
    m_table = new QTableWidget(0, 2, right);
    m_table->verticalHeader()->setVisible(false);
    m_table->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);

    auto* chartBox = new QVBoxLayout();
    m_chart = new HistogramChart(chartBox, this);

    rightLayout->addWidget(m_countLabel);
    rightLayout->addWidget(m_areaLabel);
    rightLayout->addWidget(m_coverageLabel);
    rightLayout->addWidget(m_table, 1);
    rightLayout->addLayout(chartBox, 2);

    splitter->addWidget(m_preview);
    splitter->addWidget(right);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 2);
    root->addWidget(splitter, 1);

    // ——— Разрезы ———
    auto* splitRow = new QHBoxLayout();
    m_splitButton = new QPushButton(central);
    m_splitButton->setCheckable(true);
    m_brushLabel = new QLabel(central);
    m_brushSpin = new QSpinBox(central);
    m_brushSpin->setRange(1, 30);
    m_brushSpin->setValue(3);
    m_undoSplitButton = new QPushButton(central);
    m_clearSplitsButton = new QPushButton(central);
    m_splitHint = new QLabel(central);
    m_splitHint->setStyleSheet("color: #888888;");
    splitRow->addWidget(m_splitButton);
    splitRow->addWidget(m_brushLabel);
    splitRow->addWidget(m_brushSpin);
    splitRow->addWidget(m_undoSplitButton);
    splitRow->addWidget(m_clearSplitsButton);
    splitRow->addWidget(m_splitHint, 1);
    root->addLayout(splitRow);
    m_preview->installEventFilter(this);

    // ——— Кнопки ———
    auto* buttons = new QHBoxLayout();
    m_detectButton = new QPushButton(central);
    m_exportButton = new QPushButton(central);
    buttons->addStretch();
    buttons->addWidget(m_detectButton);
    buttons->addWidget(m_exportButton);
    root->addLayout(buttons);

    setCentralWidget(central);

    connect(m_addColorButton, &QPushButton::clicked, this, &ColorAnalysisWindow::colorPickRequested);
    connect(m_removeColorButton, &QPushButton::clicked, this, &ColorAnalysisWindow::onRemoveColor);
    connect(m_autoTolButton, &QPushButton::clicked, this, &ColorAnalysisWindow::onAutoTolerance);
    connect(m_hSlider, &QSlider::valueChanged, this, &ColorAnalysisWindow::onParametersChanged);
    connect(m_sSlider, &QSlider::valueChanged, this, &ColorAnalysisWindow::onParametersChanged);
    connect(m_vSlider, &QSlider::valueChanged, this, &ColorAnalysisWindow::onParametersChanged);
    connect(m_minAreaSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &ColorAnalysisWindow::onParametersChanged);
    connect(m_detectButton, &QPushButton::clicked, this, &ColorAnalysisWindow::runDetection);
    connect(m_exportButton, &QPushButton::clicked, this, &ColorAnalysisWindow::onExportClicked);
    connect(m_splitButton, &QPushButton::toggled, this, &ColorAnalysisWindow::onSplitModeToggled);
    connect(m_undoSplitButton, &QPushButton::clicked, this, &ColorAnalysisWindow::onUndoSplit);
    connect(m_clearSplitsButton, &QPushButton::clicked, this, &ColorAnalysisWindow::onClearSplits);

    onSplitModeToggled(false);
}

void ColorAnalysisWindow::retranslate()
{
    setWindowTitle(UiStrings::text("color_analysis"));
    m_colorsLabel->setText(UiStrings::text("ca_picked_color"));
    m_addColorButton->setText(UiStrings::text("ca_add_color"));
    m_removeColorButton->setText(UiStrings::text("ca_undo_color"));
    m_autoTolButton->setText(UiStrings::text("ca_auto_tol"));
    m_tolBox->setTitle(UiStrings::text("ca_tolerance"));
    m_hLabel->setText(UiStrings::text("ca_h_tol"));
    m_sLabel->setText(UiStrings::text("ca_s_tol"));
    m_vLabel->setText(UiStrings::text("ca_v_tol"));
    m_minAreaLabel->setText(UiStrings::text("ca_min_area"));
    m_detectButton->setText(UiStrings::text("ca_detect"));
    m_exportButton->setText(UiStrings::text("ca_export_csv"));
    m_splitButton->setText(UiStrings::text("ca_split"));
    m_brushLabel->setText(UiStrings::text("ca_brush"));
    m_undoSplitButton->setText(UiStrings::text("ca_undo_split"));
    m_clearSplitsButton->setText(UiStrings::text("ca_clear_splits"));
    m_splitHint->setText(UiStrings::text("ca_split_hint"));
    m_chart->setLegendNames(UiStrings::text("hist_legend_hist"), UiStrings::text("hist_legend_fit"));
    m_table->setHorizontalHeaderLabels(QStringList() << UiStrings::text("col_id")
                                                     << UiStrings::text("ca_col_area").arg(areaUnit()));
    drawResults();
}

// ─────────────────────────────────────────────────────
// Настройки
// ─────────────────────────────────────────────────────
void ColorAnalysisWindow::setCalibration(const ScaleCalibration& calibration)
{
    m_calibration = calibration;
    retranslate();
}

void ColorAnalysisWindow::setDetectionSettings(const DetectionSettings& s)
{
    m_overlayAlpha = s.overlayAlpha;

    const QSignalBlocker bh(m_hSlider), bs(m_sSlider), bv(m_vSlider), ba(m_minAreaSpin);
    m_hSlider->setValue(s.tolerance.h);
    m_sSlider->setValue(s.tolerance.s);
    m_vSlider->setValue(s.tolerance.v);
    m_minAreaSpin->setValue(s.minArea);
}

DetectionSettings ColorAnalysisWindow::detectionSettings() const
{
    DetectionSettings s;
    s.tolerance.h = m_hSlider->value();
    s.tolerance.s = m_sSlider->value();
    s.tolerance.v = m_vSlider->value();
    s.minArea = m_minAreaSpin->value();
    s.overlayAlpha = m_overlayAlpha;
    return s;
}

// ─────────────────────────────────────────────────────
// Цвета
// ─────────────────────────────────────────────────────
void ColorAnalysisWindow::addColor(QRgb color)
{
    m_colors.push_back(color);
    drawSwatches();

    // первый цвет или новый разброс: начальный допуск
    onAutoTolerance();
}

void ColorAnalysisWindow::onRemoveColor()
{
    if (m_colors.isEmpty())
        return;
    m_colors.removeLast();
    drawSwatches();
    onParametersChanged();
}

void ColorAnalysisWindow::onAutoTolerance()
{
    const HsvTolerance tol = ParticleDetector::initialTolerance(m_colors);
    {
        const QSignalBlocker bh(m_hSlider), bs(m_sSlider), bv(m_vSlider);
        m_hSlider->setValue(tol.h);
        m_sSlider->setValue(tol.s);
        m_vSlider->setValue(tol.v);
    }
    onParametersChanged();
}

void ColorAnalysisWindow::drawSwatches()
{
    while (QLayoutItem* item = m_swatchLayout->takeAt(0)) {
        delete item->widget();
        delete item;
    }
    for (QRgb c : m_colors) {
        auto* sw = new QLabel(centralWidget());
        sw->setFixedSize(18, 18);
        sw->setStyleSheet(QString("background-color: %1; border: 1px solid #888;").arg(QColor(c).name()));
        const HsvColor hsv = ParticleDetector::toHsv(c);
        sw->setToolTip(QString("RGB(%1, %2, %3)  HSV(%4, %5, %6)")
                           .arg(qRed(c)).arg(qGreen(c)).arg(qBlue(c))
                           .arg(hsv.h, 0, 'f', 1).arg(hsv.s, 0, 'f', 1).arg(hsv.v, 0, 'f', 1));
        m_swatchLayout->addWidget(sw);
    }
    m_removeColorButton->setEnabled(!m_colors.isEmpty());
}

// ─────────────────────────────────────────────────────
// Поиск и вывод
// ─────────────────────────────────────────────────────
void ColorAnalysisWindow::onParametersChanged()
{
    emit settingsChanged(detectionSettings());
    m_debounce->start();
}

void ColorAnalysisWindow::runDetection()
{
    m_debounce->stop();

    const DetectionSettings s = detectionSettings();
    const MeasureError err = ParticleDetector::detect(m_image, m_colors, s.tolerance, s.minArea,
                                                      &m_detection, m_cuts.mask());
    if (err != MeasureError::None) {
        m_detection = ParticleDetection();
        m_fit = DistributionFit();
        m_fitError = err;
        drawResults();
        return;
    }

    const double pixelSize = m_calibration.isCalibrated()
                                 ? m_calibration.scaleFactor(m_calibration.displayUnit()) : 1.0;
    m_fitError = DistributionFitter::fit(ParticleDetector::physicalAreas(m_detection, pixelSize),
                                         0, &m_fit);
    drawResults();
}

QString ColorAnalysisWindow::areaUnit() const
{
    return m_calibration.isCalibrated() ? unitSymbol(m_calibration.displayUnit()) : QStringLiteral("px");
}

void ColorAnalysisWindow::drawResults()
{
    const QString unit = areaUnit();
    const double pixelSize = m_calibration.isCalibrated()
                                 ? m_calibration.scaleFactor(m_calibration.displayUnit()) : 1.0;

    updatePreview();

    m_countLabel->setText(UiStrings::text("ca_particle_count").arg(m_detection.count()));
    m_areaLabel->setText(UiStrings::text("ca_total_area")
                             .arg(m_detection.totalAreaPx)
                             .arg(QString::number(m_detection.totalAreaPx * pixelSize * pixelSize, 'f', 3))
                             .arg(unit));
    m_coverageLabel->setText(UiStrings::text("ca_coverage").arg(QString::number(m_detection.coveragePercent, 'f', 2)));

    const QVector<double> areas = ParticleDetector::physicalAreas(m_detection, pixelSize);
    m_table->setRowCount(areas.size());
    for (int i = 0; i < areas.size(); ++i) {
        m_table->setItem(i, 0, new QTableWidgetItem(QString::number(i + 1)));
        m_table->setItem(i, 1, new QTableWidgetItem(QString::number(areas[i], 'f', 4)));
    }

    const QString xTitle = UiStrings::text("ca_hist_xlabel").arg(unit);
    if (m_fitError == MeasureError::None) {
        m_chart->draw(m_fit, m_fitError,
                      UiStrings::text("hist_title_fmt")
                          .arg(QString::number(m_fit.mean, 'f', 3))
                          .arg(QString::number(m_fit.std, 'f', 3))
                          .arg(unit + QChar(0x00B2))
                          .arg(m_fit.totalCount),
                      xTitle);
    } else if (m_fitError == MeasureError::FitDidNotConverge) {
        m_chart->draw(m_fit, m_fitError, UiStrings::text("hist_no_fit"), xTitle);
    } else {
        m_chart->clear(m_colors.isEmpty() ? UiStrings::text("ca_no_color") : errorText(m_fitError));
    }

    m_exportButton->setEnabled(!m_detection.isEmpty());
}

void ColorAnalysisWindow::onExportClicked()
{
    if (m_detection.isEmpty()) {
        QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("no_data"));
        return;
    }

    const QString text = ExportManager::buildAreaCsv(m_detection, m_calibration, &m_fit, m_fitError);
    m_exportManager->exportCsv(this, text, QStringLiteral("particle_areas.csv"));
}

// ─────────────────────────────────────────────────────
// Превью и ручные разрезы
// ─────────────────────────────────────────────────────
void ColorAnalysisWindow::updatePreview()
{
    // оверлей и разрезы в полном разрешении, затем уменьшение до kPreviewMax
    QImage shown = m_detection.isEmpty() ? m_image
                                         : ParticleDetector::overlay(m_image, m_detection, m_overlayAlpha);
    if (shown.isNull())
        return;

    if (!m_cuts.isEmpty()) {
        QPainter painter(&shown);
        for (const CutStroke& stroke : m_cuts.strokes())
            paintStroke(painter, stroke.points, stroke.width);
    }

    m_previewBase = shown.width() > kPreviewMax || shown.height() > kPreviewMax
                        ? shown.scaled(kPreviewMax, kPreviewMax, Qt::KeepAspectRatio, Qt::SmoothTransformation)
                        : shown;
    m_preview->setPixmap(QPixmap::fromImage(m_previewBase));
}

void ColorAnalysisWindow::paintStroke(QPainter& painter, const QVector<QPointF>& points, int width) const
{
    if (points.isEmpty())
        return;
    painter.setPen(QPen(kCutColor, width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.drawPolyline(points.constData(), points.size());
}

bool ColorAnalysisWindow::toImagePoint(const QPoint& labelPos, QPointF* out) const
{
    if (m_previewBase.isNull() || m_image.isNull())
        return false;

    // pixmap отцентрирован в QLabel
    const QPointF offset((m_preview->width() - m_previewBase.width()) / 2.0,
                         (m_preview->height() - m_previewBase.height()) / 2.0);
    const QPointF local = QPointF(labelPos) - offset;
    if (local.x() < 0 || local.y() < 0
        || local.x() >= m_previewBase.width() || local.y() >= m_previewBase.height())
        return false;

    const double k = double(m_image.width()) / m_previewBase.width();
    *out = local * k;
    return true;
}

bool ColorAnalysisWindow::eventFilter(QObject* watched, QEvent* event)
{
    if (watched != m_preview || !m_splitButton->isChecked())
        return QMainWindow::eventFilter(watched, event);

    switch (event->type()) {
    case QEvent::MouseButtonPress: {
        auto* ev = static_cast<QMouseEvent*>(event);
        QPointF p;
        if (ev->button() != Qt::LeftButton || !toImagePoint(ev->position().toPoint(), &p))
            break;
        m_drawingStroke = true;
        m_strokePoints = { p };
        return true;
    }
    case QEvent::MouseMove: {
        if (!m_drawingStroke)
            break;
        auto* ev = static_cast<QMouseEvent*>(event);
        QPointF p;
        if (toImagePoint(ev->position().toPoint(), &p)) {
            m_strokePoints.push_back(p);

            // текущий штрих поверх готового превью
            QImage frame = m_previewBase.copy();
            QPainter painter(&frame);
            const double k = double(frame.width()) / m_image.width();
            painter.scale(k, k);
            paintStroke(painter, m_strokePoints, m_brushSpin->value());
            painter.end();
            m_preview->setPixmap(QPixmap::fromImage(frame));
        }
        return true;
    }
    case QEvent::MouseButtonRelease: {
        auto* ev = static_cast<QMouseEvent*>(event);
        if (!m_drawingStroke || ev->button() != Qt::LeftButton)
            break;
        m_drawingStroke = false;
        const QVector<QPointF> points = m_strokePoints;
        m_strokePoints.clear();

        if (m_cuts.addStroke(points, m_brushSpin->value())) {
            updateSplitButtons();
            runDetection();
        } else {
            updatePreview();       // клик без протяжки
        }
        return true;
    }
    default:
        break;
    }
    return QMainWindow::eventFilter(watched, event);
}

void ColorAnalysisWindow::onSplitModeToggled(bool on)
{
    m_preview->setCursor(on ? Qt::CrossCursor : Qt::ArrowCursor);
    m_brushSpin->setEnabled(on);
    m_splitHint->setVisible(on);
    if (!on && m_drawingStroke) {
        m_drawingStroke = false;
        m_strokePoints.clear();
        updatePreview();
    }
    updateSplitButtons();
}

void ColorAnalysisWindow::updateSplitButtons()
{
    m_undoSplitButton->setEnabled(!m_cuts.isEmpty());
    m_clearSplitsButton->setEnabled(!m_cuts.isEmpty());
}

void ColorAnalysisWindow::onUndoSplit()
{
    if (!m_cuts.undoStroke())
        return;
    updateSplitButtons();
    runDetection();
}

void ColorAnalysisWindow::onClearSplits()
{
    if (m_cuts.isEmpty())
        return;
    m_cuts.clear();
    updateSplitButtons();
    runDetection();
}

#include "distributionwindow.h"
#include "ui_distributionwindow.h"
#include "distribution/histogramchart.h"
#include "uistrings.h"

#include <QMessageBox>

DistributionWindow::DistributionWindow(QWidget* parent)
    : QMainWindow(parent),
    ui(new Ui::DistributionWindow),
    exportManager(new ExportManager(this))
{
    ui->setupUi(this);
    chart = new HistogramChart(ui->chartLayout, this);

    ui->comboMethod->addItem(QString(), static_cast<int>(FitMethod::LeastSquares));
    ui->comboMethod->addItem(QString(), static_cast<int>(FitMethod::MaximumLikelihood));

    //Пересчёт при смене параметров
    connect(ui->comboGroup, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &DistributionWindow::refresh);
    connect(ui->comboMethod, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &DistributionWindow::refresh);
    connect(ui->spinBins, QOverload<int>::of(&QSpinBox::valueChanged), this, &DistributionWindow::refresh);
    connect(ui->refreshButton, &QPushButton::clicked, this, &DistributionWindow::refresh);

    //Привязка кнопки Экспорт
    connect(ui->exportButton, &QPushButton::clicked, this, &DistributionWindow::onExportClicked);

    connect(exportManager, &ExportManager::exportSuccess, this, [=](const QString& path) {
        QMessageBox::information(this, UiStrings::text("export_title"), UiStrings::text("exported").arg(path));
    });
    connect(exportManager, &ExportManager::exportFailure, this, [=](const QString& error) {
        QMessageBox::warning(this, UiStrings::text("error"), UiStrings::text("export_fail").arg(error));
    });

    retranslate();
}

DistributionWindow::~DistributionWindow()
{
    delete ui;
}

void DistributionWindow::setSession(const MeasurementSession* s)
{
    session = s;
    fillGroups();
    refresh();
}

void DistributionWindow::setBinCount(int bins)
{
    ui->spinBins->setValue(qMax(0, bins));
}

void DistributionWindow::setMethod(FitMethod method)
{
    ui->comboMethod->setCurrentIndex(ui->comboMethod->findData(static_cast<int>(method)));
}

void DistributionWindow::retranslate()
{
    setWindowTitle(UiStrings::text("dist_title"));
    ui->labelGroup->setText(UiStrings::text("dist_group"));
    ui->labelBins->setText(UiStrings::text("dist_bins"));
    ui->labelMethod->setText(UiStrings::text("dist_method"));
    ui->spinBins->setSpecialValueText(UiStrings::text("dist_auto"));
    ui->comboMethod->setItemText(0, UiStrings::text("dist_ls"));
    ui->comboMethod->setItemText(1, UiStrings::text("dist_ml"));
    ui->refreshButton->setText(UiStrings::text("dist_refresh"));
    ui->exportButton->setText(UiStrings::text("dist_export"));
    chart->setLegendNames(UiStrings::text("hist_legend_hist"), UiStrings::text("hist_legend_fit"));

    fillGroups();
    refresh();
}

// Список «Все измерения» + группы сессии; выбор сохраняется по id
void DistributionWindow::fillGroups()
{
    const int keep = currentGroupId();

    ui->comboGroup->blockSignals(true);
    ui->comboGroup->clear();
    ui->comboGroup->addItem(UiStrings::text("group_all"), MeasureConst::kAllGroups);
    if (session) {
        for (const auto& g : session->groups().groups())
            ui->comboGroup->addItem(g.label, g.groupId);
    }
    const int idx = ui->comboGroup->findData(keep);
    ui->comboGroup->setCurrentIndex(idx >= 0 ? idx : 0);
    ui->comboGroup->blockSignals(false);
}

int DistributionWindow::currentGroupId() const
{
    return ui->comboGroup->count() > 0 ? ui->comboGroup->currentData().toInt()
                                       : MeasureConst::kAllGroups;
}

void DistributionWindow::refresh()
{
    if (!session) {
        lastFit = DistributionFit();
        lastError = MeasureError::InsufficientData;
        lastGroupId = MeasureConst::kAllGroups;
        chart->clear(UiStrings::text("no_image"));
        ui->labelResult->clear();
        return;
    }

    if (ui->comboGroup->count() != session->groups().groups().size() + 1)
        fillGroups();

    const auto method = static_cast<FitMethod>(ui->comboMethod->currentData().toInt());
    lastGroupId = currentGroupId();
    lastError = session->fitDistribution(&lastFit, ui->spinBins->value(), lastGroupId, method);

    const QString unit = session->unitSymbol();
    const QString xTitle = UiStrings::text("hist_xlabel").arg(unit);

    switch (lastError) {
    case MeasureError::None:
        chart->draw(lastFit, lastError,
                    UiStrings::text("hist_title_fmt")
                        .arg(QString::number(lastFit.mean, 'f', 3))
                        .arg(QString::number(lastFit.std, 'f', 3))
                        .arg(unit)
                        .arg(lastFit.totalCount),
                    xTitle);
        ui->labelResult->setText(QString("%1: %2").arg(UiStrings::text("dist_method"),
                                                       ui->comboMethod->currentText()));
        break;
    case MeasureError::FitDidNotConverge:
        // гистограмма без кривой
        chart->draw(lastFit, lastError, UiStrings::text("hist_no_fit"), xTitle);
        ui->labelResult->setText(errorText(lastError));
        break;
    default:
        chart->clear(errorText(lastError));
        ui->labelResult->setText(errorText(lastError));
        break;
    }
}

void DistributionWindow::onExportClicked()
{
    if (!session || session->store().isEmpty()) {
        QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("no_data"));
        return;
    }

    const QString text = ExportManager::buildMeasurementCsv(*session, &lastFit, lastError, lastGroupId);
    exportManager->exportCsv(this, text, QStringLiteral("measurements.csv"));
}

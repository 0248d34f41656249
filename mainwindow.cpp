#include "mainwindow.h"
#include "ui_mainwindow.h"

#include "scaledialog.h"
#include "measurelog.h"
#include "measurecalculator.h"
#include "uistrings.h"
#include "distribution/distributionwindow.h"
#include "coloranalysis/coloranalysiswindow.h"

#include <QLabel>
#include <QKeyEvent>
#include <QImageReader>
#include <QInputDialog>
#include <QFileInfo>
#include <QStatusBar>
#include <QLineEdit>
#include <QtMath>

namespace {
constexpr int kStatusTimeoutMs = 5000;
}

// Конструктор главного окна
MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , ui(new Ui::MainWindow)
{
    ui->setupUi(this);

    // Создаём все объекты ядра и визуализации
    appState        = new AppState(this);
    settingsManager = new SettingsManager(this);
    exportManager   = new ExportManager(this);
    visualizer      = new DataVisualizer(ui->tableView, ui->labelStats, ui->labelScale, this);

    // Пункты меню, зависящие от settingsManager
    addUnitAndLanguageMenus();

    const MeasureSettings ms = settingsManager->measureSettings();
    gesture.setMinDistance(ms.minClickDistance);
    ui->canvas->setMinGroupDrag(ms.minGroupDrag);

    // Строка состояния: режим | курсор | масштаб вида
    modeLabel   = new QLabel(this);
    cursorLabel = new QLabel(this);
    zoomLabel   = new QLabel(this);
    statusBar()->addPermanentWidget(modeLabel);
    statusBar()->addPermanentWidget(cursorLabel);
    statusBar()->addPermanentWidget(zoomLabel);

    ui->splitter->setStretchFactor(0, 3);
    ui->splitter->setStretchFactor(1, 1);

    // ——— Холст ———
    connect(ui->canvas, &ImageCanvas::pointClicked, this, &MainWindow::onPointClicked);
    connect(ui->canvas, &ImageCanvas::rectangleSelected, this, &MainWindow::onRectangleSelected);
    connect(ui->canvas, &ImageCanvas::measurementClicked, this, [=](int id) {
        if (id < 0) visualizer->clearSelection();
        else        visualizer->selectId(id);
    });
    connect(ui->canvas, &ImageCanvas::cursorMoved, this, [=](const QPointF& pos) {
        cursorLabel->setText(UiStrings::text("cursor_pos")
                                 .arg(QString::number(pos.x(), 'f', 1))
                                 .arg(QString::number(pos.y(), 'f', 1)));
        zoomLabel->setText(UiStrings::text("zoom_fmt").arg(qRound(ui->canvas->zoom() * 100.0)));
    });

    // Выделение в таблице подсвечивает измерения на холсте
    connect(visualizer, &DataVisualizer::selectionChanged, ui->canvas, &ImageCanvas::setSelectedIds);

    // ——— Режимы ———
    connect(appState, &AppState::stateChanged, this, &MainWindow::onAppStateChanged);

    //калибровка
    connect(ui->actionCalibrate, &QAction::triggered, this, [=]() {
        if (!session) {
            QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("no_image"));
            updateActions();
            return;
        }
        appState->setState(appState->state() == ProgramState::Calibrating
                               ? ProgramState::Idle : ProgramState::Calibrating);
    });

    //измерение (только после калибровки)
    connect(ui->actionMeasure, &QAction::triggered, this, [=]() {
        if (!session) {
            QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("no_image"));
            updateActions();
            return;
        }
        if (appState->state() == ProgramState::Measuring) {
            appState->setState(ProgramState::Idle);
            return;
        }
        if (!session->isCalibrated()) {
            showError(MeasureError::Uncalibrated);
            updateActions();
            return;
        }
        appState->setState(ProgramState::Measuring);
    });

    //выделение группы
    connect(ui->actionGroup, &QAction::triggered, this, [=]() {
        if (!session) {
            updateActions();
            return;
        }
        appState->setState(appState->state() == ProgramState::GroupSelecting
                               ? ProgramState::Idle : ProgramState::GroupSelecting);
    });

    // ——— Вид ———
    connect(ui->actionZoomIn,  &QAction::triggered, ui->canvas, &ImageCanvas::zoomIn);
    connect(ui->actionZoomOut, &QAction::triggered, ui->canvas, &ImageCanvas::zoomOut);
    connect(ui->actionZoomFit, &QAction::triggered, ui->canvas, &ImageCanvas::fitToWindow);
    connect(ui->actionZoom100, &QAction::triggered, ui->canvas, &ImageCanvas::actualSize);
    connect(ui->actionExit,    &QAction::triggered, this, &QWidget::close);

    // ——— Справка ———
    connect(ui->actionUsage, &QAction::triggered, this, [=]() {
        QMessageBox::information(this, UiStrings::text("menu_usage"), UiStrings::text("help_text"));
    });
    connect(ui->actionLicenses, &QAction::triggered, this, [=]() {
        QMessageBox::information(this, UiStrings::text("menu_licenses"), UiStrings::text("licenses_text"));
    });
    connect(ui->actionAbout, &QAction::triggered, this, [=]() {
        QMessageBox::about(this, UiStrings::text("menu_about"), UiStrings::text("about_text"));
    });

    // ——— Настройки ———
    connect(settingsManager, &SettingsManager::displayUnitChanged, this, &MainWindow::onDisplayUnitChanged);
    connect(settingsManager, &SettingsManager::languageChanged, this, &MainWindow::onLanguageChanged);

    // ——— Экспорт ———
    connect(exportManager, &ExportManager::exportSuccess, this, [=](const QString& path) {
        showStatus(UiStrings::text("exported").arg(path));
    });
    connect(exportManager, &ExportManager::exportFailure, this, [=](const QString& error) {
        QMessageBox::warning(this, UiStrings::text("error"), UiStrings::text("export_fail").arg(error));
    });

    retranslate();
    refreshViews();

    // Начальное состояние Idle
    onAppStateChanged(ProgramState::Idle);
}

MainWindow::~MainWindow()
{
    // Дочерние окна читают сессию до своего удаления
    if (distributionWindow)
        distributionWindow->setSession(nullptr);
    ui->canvas->setSession(nullptr);
    delete session;
    delete ui;
}

// ─────────────────────────────────────────────────────
// Изображение
// ─────────────────────────────────────────────────────
bool MainWindow::openImage(const QString& path)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull()) {
        qCWarning(lcSession) << "cannot open" << path << reader.errorString();
        QMessageBox::warning(this, UiStrings::text("error"),
                             UiStrings::text("open_fail").arg(reader.errorString()));
        return false;
    }

    // Цветовой анализ привязан к старому изображению
    if (colorWindow) {
        colorWindow->close();
        colorWindow = nullptr;
    }

    // Новая сессия на каждое изображение
    MeasurementSession* old = session;
    session = new MeasurementSession();
    session->setDisplayUnit(settingsManager->displayUnit());

    ui->canvas->setImage(image);
    ui->canvas->setSession(session);
    if (distributionWindow)
        distributionWindow->setSession(session);
    delete old;

    imagePath = path;
    gesture.reset();

    qCInfo(lcSession) << "image opened" << path << image.size();

    retranslate();
    refreshViews();
    appState->setState(ProgramState::Idle);
    onAppStateChanged(ProgramState::Idle);
    return true;
}

void MainWindow::on_actionOpen_triggered()
{
    QStringList patterns;
    for (const QByteArray& fmt : QImageReader::supportedImageFormats())
        patterns << "*." + QString::fromLatin1(fmt);

    const QString filter = QString("%1 (%2);;%3 (*)")
                               .arg(UiStrings::text("img_files"), patterns.join(' '),
                                    UiStrings::text("all_files"));

    const QString path = QFileDialog::getOpenFileName(this, UiStrings::text("open_image_title"),
                                                      QFileInfo(imagePath).absolutePath(), filter);
    if (path.isEmpty())
        return;
    openImage(path);
}

// ─────────────────────────────────────────────────────
// Смена режима
// ─────────────────────────────────────────────────────
void MainWindow::onAppStateChanged(ProgramState state)
{
    gesture.reset();
    ui->canvas->clearPendingPoint();
    ui->canvas->setMode(state);

    ui->actionCalibrate->setChecked(state == ProgramState::Calibrating);
    ui->actionMeasure->setChecked(state == ProgramState::Measuring);
    ui->actionGroup->setChecked(state == ProgramState::GroupSelecting);

    modeLabel->setText(UiStrings::text(AppState::stateKey(state)));

    switch (state) {
    case ProgramState::Idle:
        statusBar()->showMessage(UiStrings::text(session ? "status_ready" : "no_image"));
        break;
    case ProgramState::Calibrating:
        statusBar()->showMessage(UiStrings::text("scale_click1"));
        break;
    case ProgramState::Measuring:
        statusBar()->showMessage(UiStrings::text("meas_click1"));
        break;
    case ProgramState::GroupSelecting:
        statusBar()->showMessage(UiStrings::text("group_hint"));
        break;
    case ProgramState::PickingColor:
        statusBar()->showMessage(UiStrings::text("pick_color_hint"));
        break;
    }
}

void MainWindow::onPointClicked(const QPointF& pos)
{
    if (!session)
        return;

    switch (appState->state()) {
    case ProgramState::Calibrating:  handleCalibrationClick(pos); break;
    case ProgramState::Measuring:    handleMeasureClick(pos);     break;
    case ProgramState::PickingColor: handlePickClick(pos);        break;
    default: break;
    }
}

// ——— Калибровка: два клика → диалог длины ———
void MainWindow::handleCalibrationClick(const QPointF& pos)
{
    if (!gesture.press(pos)) {
        showStatus(UiStrings::text("meas_too_short"));
        return;
    }
    if (!gesture.isCompleted()) {
        ui->canvas->setPendingPoint(pos);
        statusBar()->showMessage(UiStrings::text("scale_click2"));
        return;
    }

    const QPointF p1 = gesture.firstPoint();
    const QPointF p2 = gesture.secondPoint();
    gesture.reset();
    ui->canvas->clearPendingPoint();
    ui->canvas->setScaleLine(p1, p2);

    // 1) Диалог с измеренным отрезком и прошлыми значениями
    const ScaleCalibration& calib = session->calibration();
    ScaleInput input;
    input.pixelDistance  = MeasureCalculator::distance(p1, p2);
    input.physicalLength = calib.isCalibrated() ? calib.physicalLength() : 0.0;
    input.unit           = calib.isCalibrated() ? calib.unit() : settingsManager->measureSettings().defaultUnit;

    ScaleDialog dlg(this);
    dlg.loadInput(input);

    // 2) Отмена: остаёмся в калибровке
    if (dlg.exec() != QDialog::Accepted) {
        ui->canvas->clearScaleLine();
        statusBar()->showMessage(UiStrings::text("scale_click1"));
        return;
    }

    // 3) Применяем; все измерения пересчитываются
    const ScaleInput result = dlg.currentInput();
    const MeasureError err = session->calibrate(result.pixelDistance, result.physicalLength, result.unit);
    if (err != MeasureError::None) {
        qCWarning(lcSession) << "calibration rejected:" << errorName(err);
        showError(err);
        return;
    }

    settingsManager->selectUnit(result.unit);
    qCInfo(lcSession) << "scale set" << result.physicalLength << unitSymbol(result.unit)
                      << "over" << result.pixelDistance << "px";

    refreshViews();
    appState->setState(ProgramState::Measuring);
    showStatus(UiStrings::text("scale_set")
                   .arg(QString::number(session->calibration().scaleFactor(result.unit), 'g', 6))
                   .arg(unitSymbol(result.unit)));
}

// ——— Измерение диаметра ———
void MainWindow::handleMeasureClick(const QPointF& pos)
{
    if (!gesture.press(pos)) {
        showStatus(UiStrings::text("meas_too_short"));
        return;
    }
    if (!gesture.isCompleted()) {
        ui->canvas->setPendingPoint(pos);
        statusBar()->showMessage(UiStrings::text("meas_click2"));
        return;
    }

    const QPointF p1 = gesture.firstPoint();
    const QPointF p2 = gesture.secondPoint();
    gesture.reset();
    ui->canvas->clearPendingPoint();

    Measurement m;
    const MeasureError err = session->addMeasurement(p1, p2, &m);
    if (err != MeasureError::None) {
        showError(err);
        return;
    }

    refreshViews();
    showStatus(UiStrings::text("meas_recorded")
                   .arg(m.id)
                   .arg(QString::number(session->displayValue(m), 'f', 4))
                   .arg(session->unitSymbol()));

    // Уведомление каждые N измерений
    const int milestone = settingsManager->measureSettings().milestone;
    const int count = session->store().size();
    if (milestone > 0 && count % milestone == 0) {
        QMessageBox::information(this, UiStrings::text("info"),
                                 UiStrings::text("meas_milestone").arg(count));
    }
}

// ——— Выбор цвета для цветового анализа ———
void MainWindow::handlePickClick(const QPointF& pos)
{
    const QImage& image = ui->canvas->image();
    const QPoint px(qFloor(pos.x()), qFloor(pos.y()));
    if (!colorWindow || !image.valid(px))
        return;

    colorWindow->addColor(image.pixel(px));
    appState->setState(ProgramState::Idle);
    colorWindow->raise();
    colorWindow->activateWindow();
}

// ——— Рамка группы ———
void MainWindow::onRectangleSelected(const QRectF& rect)
{
    if (!session)
        return;

    if (GroupingIndex::countInside(rect, session->store()) == 0) {
        QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("group_empty"));
        return;
    }

    bool ok = false;
    const QString label = QInputDialog::getText(this, UiStrings::text("menu_group"),
                                                UiStrings::text("group_name_prompt"),
                                                QLineEdit::Normal, QString(), &ok).trimmed();
    if (!ok)
        return;

    int members = 0;
    const MeasurementGroup group = session->createGroup(rect, label, &members);
    qCInfo(lcSession) << "group" << group.groupId << group.label << "members" << members;

    refreshViews();
    appState->setState(ProgramState::Idle);
    showStatus(UiStrings::text("group_created").arg(group.label).arg(members));
}

void MainWindow::keyPressEvent(QKeyEvent* ev)
{
    if (ev->key() == Qt::Key_Escape) {
        cancelClick();
        return;
    }
    QMainWindow::keyPressEvent(ev);
}

void MainWindow::cancelClick()
{
    if (gesture.undoClick()) {
        ui->canvas->clearPendingPoint();
        const bool calibrating = appState->state() == ProgramState::Calibrating;
        statusBar()->showMessage(UiStrings::text(calibrating ? "scale_click1" : "meas_click1"));
        showStatus(UiStrings::text("meas_cancelled"));
        return;
    }
    appState->setState(ProgramState::Idle);
}

// ─────────────────────────────────────────────────────
// Правка журнала
// ─────────────────────────────────────────────────────
void MainWindow::on_actionUndo_triggered()
{
    if (!session)
        return;

    // Незавершённый жест отменяется раньше измерений
    if (gesture.hasFirstPoint()) {
        cancelClick();
        return;
    }

    int id = -1;
    const MeasureError err = session->undo(&id);
    if (err != MeasureError::None) {
        showStatus(errorText(err));
        return;
    }
    refreshViews();
    showStatus(UiStrings::text("undo_meas").arg(id));
}

void MainWindow::on_actionDeleteSelected_triggered()
{
    if (!session)
        return;
    const QSet<int> ids = visualizer->selectedIds();
    if (ids.isEmpty())
        return;

    if (QMessageBox::question(this, UiStrings::text("confirm"), UiStrings::text("delete_confirm"))
        != QMessageBox::Yes)
        return;

    for (int id : ids) {
        const MeasureError err = session->remove(id);
        if (err != MeasureError::None)
            qCWarning(lcSession) << "remove" << id << errorName(err);
    }
    visualizer->clearSelection();
    refreshViews();
}

void MainWindow::on_actionClear_triggered()
{
    if (!session || (session->store().isEmpty() && session->groups().isEmpty()))
        return;

    if (QMessageBox::question(this, UiStrings::text("confirm"), UiStrings::text("clear_confirm"))
        != QMessageBox::Yes)
        return;

    session->clear();
    qCInfo(lcSession) << "session cleared";
    refreshViews();
}

void MainWindow::on_actionDeleteGroup_triggered()
{
    if (!session || session->groups().isEmpty()) {
        showError(MeasureError::NotFound);
        return;
    }

    const GroupList& groups = session->groups().groups();
    QStringList labels;
    for (const auto& g : groups)
        labels << g.label;

    bool ok = false;
    const QString chosen = QInputDialog::getItem(this, UiStrings::text("menu_delete_group"),
                                                 UiStrings::text("group_delete_prompt"),
                                                 labels, labels.size() - 1, false, &ok);
    const int index = labels.indexOf(chosen);
    if (!ok || index < 0)
        return;

    const MeasureError err = session->deleteGroup(groups[index].groupId);
    if (err != MeasureError::None) {
        showError(err);
        return;
    }
    // освобождённые измерения переходят в оставшиеся пересекающиеся рамки
    session->reassignGroups();
    refreshViews();
    showStatus(UiStrings::text("group_deleted").arg(chosen));
}

// ─────────────────────────────────────────────────────
// Окна и экспорт
// ─────────────────────────────────────────────────────
void MainWindow::on_actionDistribution_triggered()
{
    if (!distributionWindow) {
        distributionWindow = new DistributionWindow(this);
        distributionWindow->setAttribute(Qt::WA_DeleteOnClose);  // автоудаление при закрытии

        const MeasureSettings ms = settingsManager->measureSettings();
        distributionWindow->setBinCount(ms.binCount);
        distributionWindow->setMethod(ms.fitMethod);
    }
    distributionWindow->setSession(session);
    distributionWindow->show();
    distributionWindow->raise();
}

void MainWindow::on_actionColorAnalysis_triggered()
{
    if (!session) {
        QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("no_image"));
        return;
    }

    if (!colorWindow) {
        colorWindow = new ColorAnalysisWindow(ui->canvas->image(), this);
        colorWindow->setAttribute(Qt::WA_DeleteOnClose);
        colorWindow->setDetectionSettings(settingsManager->detectionSettings());

        connect(colorWindow, &ColorAnalysisWindow::colorPickRequested, this, [=]() {
            appState->setState(ProgramState::PickingColor);
            raise();
            activateWindow();
        });
        connect(colorWindow, &ColorAnalysisWindow::settingsChanged,
                settingsManager, &SettingsManager::setDetectionSettings);
    }
    colorWindow->setCalibration(session->calibration());
    colorWindow->show();

    // Сразу предлагаем выбрать первый цвет
    appState->setState(ProgramState::PickingColor);
    raise();
    activateWindow();
}

void MainWindow::on_actionExport_triggered()
{
    if (!session || session->store().isEmpty()) {
        QMessageBox::warning(this, UiStrings::text("warn"), UiStrings::text("no_data"));
        return;
    }

    const MeasureSettings ms = settingsManager->measureSettings();
    DistributionFit fit;
    const MeasureError fitErr = session->fitDistribution(&fit, ms.binCount,
                                                         MeasureConst::kAllGroups, ms.fitMethod);
    if (fitErr != MeasureError::None)
        qCInfo(lcExport) << "exporting without fit:" << errorName(fitErr);

    const QString text = ExportManager::buildMeasurementCsv(*session, &fit, fitErr);
    const QString base = imagePath.isEmpty() ? QStringLiteral("measurements")
                                             : QFileInfo(imagePath).completeBaseName();
    exportManager->exportCsv(this, text, base + "_measurements.csv");
}

// ─────────────────────────────────────────────────────
// Настройки
// ─────────────────────────────────────────────────────
void MainWindow::addUnitAndLanguageMenus()
{
    for (LengthUnit unit : allLengthUnits()) {
        QAction* action = ui->menuUnits->addAction(unitSymbol(unit));
        settingsManager->registerUnit(unit, action);
    }

    settingsManager->registerLanguage(UiLanguage::Russian, ui->menuLanguage->addAction(QString()));
    settingsManager->registerLanguage(UiLanguage::English, ui->menuLanguage->addAction(QString()));
}

void MainWindow::onDisplayUnitChanged(LengthUnit unit)
{
    if (!session)
        return;
    session->setDisplayUnit(unit);
    if (colorWindow)
        colorWindow->setCalibration(session->calibration());
    refreshViews();
}

void MainWindow::onLanguageChanged()
{
    retranslate();
    visualizer->retranslate(session);
    if (distributionWindow)
        distributionWindow->retranslate();
    if (colorWindow)
        colorWindow->retranslate();
    onAppStateChanged(appState->state());
}

void MainWindow::retranslate()
{
    const QString title = UiStrings::text("app_title");
    setWindowTitle(imagePath.isEmpty() ? title
                                       : QString("%1 - %2").arg(title, QFileInfo(imagePath).fileName()));

    ui->menuFile->setTitle(UiStrings::text("menu_file"));
    ui->menuTools->setTitle(UiStrings::text("menu_tools"));
    ui->menuView->setTitle(UiStrings::text("menu_view"));
    ui->menuSettings->setTitle(UiStrings::text("menu_settings"));
    ui->menuUnits->setTitle(UiStrings::text("menu_units"));
    ui->menuLanguage->setTitle(UiStrings::text("menu_language"));
    ui->menuHelp->setTitle(UiStrings::text("menu_help"));

    ui->actionOpen->setText(UiStrings::text("menu_open"));
    ui->actionExport->setText(UiStrings::text("menu_export"));
    ui->actionExit->setText(UiStrings::text("menu_exit"));
    ui->actionCalibrate->setText(UiStrings::text("menu_calibrate"));
    ui->actionMeasure->setText(UiStrings::text("menu_measure"));
    ui->actionGroup->setText(UiStrings::text("menu_group"));
    ui->actionDeleteGroup->setText(UiStrings::text("menu_delete_group"));
    ui->actionUndo->setText(UiStrings::text("menu_undo"));
    ui->actionDeleteSelected->setText(UiStrings::text("menu_delete"));
    ui->actionClear->setText(UiStrings::text("menu_clear"));
    ui->actionDistribution->setText(UiStrings::text("menu_distribution"));
    ui->actionColorAnalysis->setText(UiStrings::text("color_analysis"));
    ui->actionZoomIn->setText(UiStrings::text("menu_zoom_in"));
    ui->actionZoomOut->setText(UiStrings::text("menu_zoom_out"));
    ui->actionZoomFit->setText(UiStrings::text("menu_zoom_fit"));
    ui->actionZoom100->setText(UiStrings::text("menu_zoom_100"));
    ui->actionUsage->setText(UiStrings::text("menu_usage"));
    ui->actionLicenses->setText(UiStrings::text("menu_licenses"));
    ui->actionAbout->setText(UiStrings::text("menu_about"));
}

// ─────────────────────────────────────────────────────
// Обновление отображения
// ─────────────────────────────────────────────────────
void MainWindow::refreshViews()
{
    visualizer->refresh(session);
    ui->canvas->update();
    if (distributionWindow)
        distributionWindow->refresh();
    updateActions();
}

void MainWindow::updateActions()
{
    const bool hasSession = session != nullptr;
    const bool hasData = hasSession && !session->store().isEmpty();

    ui->actionCalibrate->setEnabled(hasSession);
    ui->actionMeasure->setEnabled(hasSession);
    ui->actionGroup->setEnabled(hasData);
    ui->actionDeleteGroup->setEnabled(hasSession && !session->groups().isEmpty());
    ui->actionUndo->setEnabled(hasSession);
    ui->actionDeleteSelected->setEnabled(hasData);
    ui->actionClear->setEnabled(hasData || (hasSession && !session->groups().isEmpty()));
    ui->actionExport->setEnabled(hasData);
    ui->actionColorAnalysis->setEnabled(hasSession);

    // Состояние пунктов-переключателей определяется режимом
    ui->actionCalibrate->setChecked(appState->state() == ProgramState::Calibrating);
    ui->actionMeasure->setChecked(appState->state() == ProgramState::Measuring);
    ui->actionGroup->setChecked(appState->state() == ProgramState::GroupSelecting);
}

void MainWindow::showStatus(const QString& text)
{
    statusBar()->showMessage(text, kStatusTimeoutMs);
}

// Ошибки ядра: модально, кроме восстановимых
void MainWindow::showError(MeasureError err)
{
    if (err == MeasureError::None)
        return;
    if (isRecoverable(err)) {
        showStatus(errorText(err));
        return;
    }
    QMessageBox::warning(this, UiStrings::text("warn"), errorText(err));
}

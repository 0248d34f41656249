#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QMessageBox>
#include <QFileDialog>
#include <QPointer>
#include "appstate.h"
#include "clickgesture.h"
#include "datavisualizer.h"
#include "exportmanager.h"
#include "settingsmanager.h"
#include "measurementsession.h"

class QLabel;
class DistributionWindow;
class ColorAnalysisWindow;

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    // Открыть изображение (из меню или из командной строки)
    bool openImage(const QString& path);

protected:
    void keyPressEvent(QKeyEvent* ev) override;

private slots:
    void onAppStateChanged(ProgramState state);
    void onPointClicked(const QPointF& pos);
    void onRectangleSelected(const QRectF& rect);
    void onDisplayUnitChanged(LengthUnit unit);
    void onLanguageChanged();

    void on_actionOpen_triggered();
    void on_actionExport_triggered();
    void on_actionUndo_triggered();
    void on_actionDeleteSelected_triggered();
    void on_actionClear_triggered();
    void on_actionDeleteGroup_triggered();
    void on_actionDistribution_triggered();
    void on_actionColorAnalysis_triggered();

private:
    void handleCalibrationClick(const QPointF& pos);
    void handleMeasureClick(const QPointF& pos);
    void handlePickClick(const QPointF& pos);
    void cancelClick();            // Esc: убрать первую точку или выйти в просмотр

    void refreshViews();           // таблица, статистика, холст, окно распределения
    void showStatus(const QString& text);
    void showError(MeasureError err);
    void retranslate();
    void addUnitAndLanguageMenus();  // пункты единиц и языка в меню «Настройки»
    void updateActions();

    Ui::MainWindow *ui;
    AppState* appState;
    SettingsManager* settingsManager;
    DataVisualizer* visualizer;
    ExportManager* exportManager;
    MeasurementSession* session = nullptr;   // пересоздаётся при загрузке изображения

    ClickGesture gesture;
    QString imagePath;

    QPointer<DistributionWindow> distributionWindow;
    QPointer<ColorAnalysisWindow> colorWindow;

    QLabel* modeLabel;
    QLabel* cursorLabel;
    QLabel* zoomLabel;
};

#endif // MAINWINDOW_H

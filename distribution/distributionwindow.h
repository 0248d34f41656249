#ifndef DISTRIBUTIONWINDOW_H
#define DISTRIBUTIONWINDOW_H

#include <QMainWindow>
#include "measurementsession.h"
#include "exportmanager.h"

class HistogramChart;
namespace Ui { class DistributionWindow; }

// Окно распределения: гистограмма + Гаусс, выбор группы/столбцов/метода, экспорт
class DistributionWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit DistributionWindow(QWidget* parent = nullptr);
    ~DistributionWindow();

    // Сессия принадлежит главному окну; nullptr: изображение закрыто
    void setSession(const MeasurementSession* session);

    void setBinCount(int bins);
    void setMethod(FitMethod method);

public slots:
    void refresh();          // пересчитать по текущим данным
    void retranslate();

private slots:
    void onExportClicked();

private:
    void fillGroups();
    int currentGroupId() const;

    Ui::DistributionWindow* ui = nullptr;
    HistogramChart* chart = nullptr;
    ExportManager* exportManager = nullptr;

    const MeasurementSession* session = nullptr;
    DistributionFit lastFit;
    MeasureError lastError = MeasureError::InsufficientData;
    int lastGroupId = MeasureConst::kAllGroups;   // выборка lastFit
};

#endif // DISTRIBUTIONWINDOW_H

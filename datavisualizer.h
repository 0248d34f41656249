#ifndef DATAVISUALIZER_H
#define DATAVISUALIZER_H

#include <QObject>
#include <QTableView>
#include <QLabel>
#include <QStandardItemModel>
#include <QHeaderView>
#include <QSet>

class MeasurementSession;

// Таблица измерений и строка статистики главного окна
class DataVisualizer : public QObject
{
    Q_OBJECT
public:
    explicit DataVisualizer(QTableView* table,
                            QLabel* statsLabel,
                            QLabel* scaleLabel,
                            QObject *parent = nullptr);

    // Перестроить таблицу и статистику по сессии (nullptr: пусто)
    void refresh(const MeasurementSession* session);

    // Заголовки после смены языка
    void retranslate(const MeasurementSession* session);

    // Выделенные строки → id измерений
    QSet<int> selectedIds() const;
    void selectId(int id);
    void clearSelection();

    QAbstractItemModel* model() const { return m_model; }

signals:
    void selectionChanged(const QSet<int>& ids);

private:
    void setHeaders(const MeasurementSession* session);
    void drawStatistics(const MeasurementSession* session);

    QTableView* m_table;
    QLabel* m_statsLabel;
    QLabel* m_scaleLabel;
    QStandardItemModel* m_model;
};

#endif // DATAVISUALIZER_H

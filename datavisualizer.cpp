#include "datavisualizer.h"
#include "measurementsession.h"
#include "uistrings.h"

#include <QStandardItem>
#include <QItemSelectionModel>

namespace {
enum Column { ColId = 0, ColValue, ColPixels, ColGroup, ColCount };
}

// Конструктор: модель таблицы и начальное отображение
DataVisualizer::DataVisualizer(QTableView* table,
                               QLabel* statsLabel,
                               QLabel* scaleLabel,
                               QObject *parent)
    : QObject(parent),
    m_table(table),
    m_statsLabel(statsLabel),
    m_scaleLabel(scaleLabel),
    m_model(new QStandardItemModel(this))
{
    m_table->setModel(m_model);
    m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_table->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_table->verticalHeader()->setVisible(false);
    m_table->horizontalHeader()->setDefaultAlignment(Qt::AlignHCenter | Qt::AlignVCenter);
    m_table->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);

    connect(m_table->selectionModel(), &QItemSelectionModel::selectionChanged, this, [=]() {
        emit selectionChanged(selectedIds());
    });

    refresh(nullptr);
}

void DataVisualizer::setHeaders(const MeasurementSession* session)
{
    const QString unit = session ? session->unitSymbol() : QStringLiteral("—");
    m_model->setHorizontalHeaderLabels(QStringList()
                                       << UiStrings::text("col_id")
                                       << UiStrings::text("col_value").arg(unit)
                                       << UiStrings::text("col_pixels")
                                       << UiStrings::text("col_group"));
}

void DataVisualizer::refresh(const MeasurementSession* session)
{
    const QSet<int> keep = selectedIds();

    m_model->removeRows(0, m_model->rowCount());
    setHeaders(session);

    if (session) {
        for (const auto& m : session->store().measurements()) {
            QList<QStandardItem*> row;
            auto* idItem = new QStandardItem(QString::number(m.id));
            idItem->setData(m.id, Qt::UserRole);
            idItem->setTextAlignment(Qt::AlignCenter);

            auto* valueItem = new QStandardItem(QString::number(session->displayValue(m), 'f', 4));
            auto* pxItem    = new QStandardItem(QString::number(m.pixelDistance, 'f', 2));
            const QString label = session->groups().labelOf(m.groupId);
            auto* groupItem = new QStandardItem(label.isEmpty() ? UiStrings::text("group_none") : label);

            valueItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
            pxItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
            groupItem->setTextAlignment(Qt::AlignCenter);

            row << idItem << valueItem << pxItem << groupItem;
            m_model->appendRow(row);
        }
    }

    // восстановить выделение по id
    for (int id : keep) selectId(id);

    if (m_model->rowCount() > 0)
        m_table->scrollToBottom();

    drawStatistics(session);
}

void DataVisualizer::retranslate(const MeasurementSession* session)
{
    setHeaders(session);
    drawStatistics(session);
}

void DataVisualizer::drawStatistics(const MeasurementSession* session)
{
    if (!session || !session->isCalibrated()) {
        m_scaleLabel->setText(UiStrings::text("scale_none"));
    } else {
        const auto& c = session->calibration();
        m_scaleLabel->setText(UiStrings::text("scale_set")
                                  .arg(QString::number(c.scaleFactor(c.displayUnit()), 'g', 6))
                                  .arg(session->unitSymbol()));
    }

    if (!session || session->store().isEmpty()) {
        m_statsLabel->setText(UiStrings::text("no_data"));
        return;
    }

    const SampleStatistics s = session->statistics();
    m_statsLabel->setText(UiStrings::text("stats_fmt")
                              .arg(s.count)
                              .arg(QString::number(s.mean, 'f', 4))
                              .arg(QString::number(s.std, 'f', 4))
                              .arg(session->unitSymbol())
                              .arg(QString::number(s.min, 'f', 4))
                              .arg(QString::number(s.max, 'f', 4)));
}

QSet<int> DataVisualizer::selectedIds() const
{
    QSet<int> ids;
    if (!m_table->selectionModel())
        return ids;
    for (const QModelIndex& idx : m_table->selectionModel()->selectedRows(ColId))
        ids.insert(idx.data(Qt::UserRole).toInt());
    return ids;
}

void DataVisualizer::selectId(int id)
{
    for (int r = 0; r < m_model->rowCount(); ++r) {
        if (m_model->item(r, ColId)->data(Qt::UserRole).toInt() == id) {
            m_table->selectionModel()->select(m_model->index(r, 0),
                                              QItemSelectionModel::Select | QItemSelectionModel::Rows);
            m_table->scrollTo(m_model->index(r, 0));
            return;
        }
    }
}

void DataVisualizer::clearSelection()
{
    m_table->clearSelection();
}

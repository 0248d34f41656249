#include "scaledialog.h"
#include "ui_scaledialog.h"
#include "uistrings.h"
#include "measureerror.h"

#include <QMessageBox>

ScaleDialog::ScaleDialog(QWidget *parent) :
    QDialog(parent),
    ui(new Ui::ScaleDialog)
{
    ui->setupUi(this);

    for (LengthUnit u : allLengthUnits())
        ui->comboUnit->addItem(unitSymbol(u), static_cast<int>(u));

    connect(ui->btnSave,   &QPushButton::clicked, this, &ScaleDialog::Save);
    connect(ui->btnCancel, &QPushButton::clicked, this, &ScaleDialog::Cancel);

    retranslate();
}

ScaleDialog::~ScaleDialog()
{
    delete ui;
}

void ScaleDialog::retranslate()
{
    setWindowTitle(UiStrings::text("scale_dialog_title"));
    ui->labelPixels->setText(UiStrings::text("scale_pixels"));
    ui->labelLength->setText(UiStrings::text("scale_length"));
    ui->labelUnit->setText(UiStrings::text("scale_unit"));
}

void ScaleDialog::loadInput(const ScaleInput& input)
{
    m_input = input;
    ui->editPixels->setText(QString::number(input.pixelDistance, 'f', 2));
    if (input.physicalLength > 0.0)
        ui->spinLength->setValue(input.physicalLength);
    ui->comboUnit->setCurrentIndex(ui->comboUnit->findData(static_cast<int>(input.unit)));
    ui->spinLength->setFocus();
    ui->spinLength->selectAll();
}

ScaleInput ScaleDialog::currentInput() const
{
    return m_input;
}

void ScaleDialog::Save()
{
    const double length = ui->spinLength->value();
    if (!(length > 0.0)) {
        QMessageBox::warning(this, UiStrings::text("warn"), errorText(MeasureError::InvalidScale));
        return;
    }

    m_input.physicalLength = length;
    m_input.unit = static_cast<LengthUnit>(ui->comboUnit->currentData().toInt());
    accept();
}

void ScaleDialog::Cancel()
{
    reject();
}

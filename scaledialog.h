#ifndef SCALEDIALOG_H
#define SCALEDIALOG_H

#include <QDialog>
#include "lengthunit.h"

namespace Ui {
class ScaleDialog;
}

// Ввод длины масштабной линейки
struct ScaleInput {
    double pixelDistance = 0.0;
    double physicalLength = 0.0;
    LengthUnit unit = LengthUnit::Nanometer;
};

class ScaleDialog : public QDialog
{
    Q_OBJECT

public:
    explicit ScaleDialog(QWidget *parent = nullptr);
    ~ScaleDialog();

    // Заполнить поля: измеренный отрезок и предыдущие значения
    void loadInput(const ScaleInput& input);

    // Введённые значения после Save
    ScaleInput currentInput() const;

private slots:
    void Save();      // btnSave: проверяет и закрывает диалог
    void Cancel();    // btnCancel: закрывает без сохранения

private:
    void retranslate();

    Ui::ScaleDialog *ui;
    ScaleInput m_input;
};

#endif // SCALEDIALOG_H

#ifndef MEASUREERROR_H
#define MEASUREERROR_H

#include <QString>

// Результат операций ядра. None: успех.
// Ошибки калибровки и поиска всегда показываются пользователю,
// EmptyGroup и FitDidNotConverge: восстановимые (N/A или гистограмма без кривой).
enum class MeasureError {
    None,
    InvalidScale,
    Uncalibrated,
    NothingToUndo,
    NotFound,
    EmptyGroup,
    InsufficientData,
    DegenerateDistribution,
    FitDidNotConverge
};

// Короткое имя для логов ("InvalidScale", ...)
QString errorName(MeasureError error);

// Текст для пользователя на текущем языке интерфейса
QString errorText(MeasureError error);

// Ошибки, после которых вызывающий продолжает работу с деградацией
inline bool isRecoverable(MeasureError error)
{
    return error == MeasureError::EmptyGroup || error == MeasureError::FitDidNotConverge;
}

#endif // MEASUREERROR_H

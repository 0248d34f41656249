#include "measureerror.h"
#include "uistrings.h"

QString errorName(MeasureError error)
{
    switch (error) {
    case MeasureError::None:                   return QStringLiteral("None");
    case MeasureError::InvalidScale:           return QStringLiteral("InvalidScale");
    case MeasureError::Uncalibrated:           return QStringLiteral("Uncalibrated");
    case MeasureError::NothingToUndo:          return QStringLiteral("NothingToUndo");
    case MeasureError::NotFound:               return QStringLiteral("NotFound");
    case MeasureError::EmptyGroup:             return QStringLiteral("EmptyGroup");
    case MeasureError::InsufficientData:       return QStringLiteral("InsufficientData");
    case MeasureError::DegenerateDistribution: return QStringLiteral("DegenerateDistribution");
    case MeasureError::FitDidNotConverge:      return QStringLiteral("FitDidNotConverge");
    }
    return QStringLiteral("Unknown");
}

QString errorText(MeasureError error)
{
    switch (error) {
    case MeasureError::None:                   return QString();
    case MeasureError::InvalidScale:           return UiStrings::text("err_invalid_scale");
    case MeasureError::Uncalibrated:           return UiStrings::text("err_uncalibrated");
    case MeasureError::NothingToUndo:          return UiStrings::text("err_nothing_to_undo");
    case MeasureError::NotFound:               return UiStrings::text("err_not_found");
    case MeasureError::EmptyGroup:             return UiStrings::text("err_empty_group");
    case MeasureError::InsufficientData:       return UiStrings::text("err_insufficient_data");
    case MeasureError::DegenerateDistribution: return UiStrings::text("err_degenerate");
    case MeasureError::FitDidNotConverge:      return UiStrings::text("err_fit_failed");
    }
    return QString();
}

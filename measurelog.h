#ifndef MEASURELOG_H
#define MEASURELOG_H

#include <QLoggingCategory>

// Категории логирования. Включение отладки: QT_LOGGING_RULES="nanosizer.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcFit)
Q_DECLARE_LOGGING_CATEGORY(lcExport)
Q_DECLARE_LOGGING_CATEGORY(lcDetect)

#endif // MEASURELOG_H

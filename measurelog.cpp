#include "measurelog.h"

Q_LOGGING_CATEGORY(lcSession, "nanosizer.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFit,     "nanosizer.fit",     QtInfoMsg)
Q_LOGGING_CATEGORY(lcExport,  "nanosizer.export",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcDetect,  "nanosizer.detect",  QtInfoMsg)

#include "tasklist/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcData, "tasklist.data", QtWarningMsg)
Q_LOGGING_CATEGORY(lcStore, "tasklist.store", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCli, "tasklist.cli", QtWarningMsg)

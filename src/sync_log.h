#pragma once

#include <QLoggingCategory>

namespace homesync {

Q_DECLARE_LOGGING_CATEGORY(pushLog)
Q_DECLARE_LOGGING_CATEGORY(codecLog)
Q_DECLARE_LOGGING_CATEGORY(storeLog)
Q_DECLARE_LOGGING_CATEGORY(pollLog)
Q_DECLARE_LOGGING_CATEGORY(writeLog)
Q_DECLARE_LOGGING_CATEGORY(gatewayLog)
Q_DECLARE_LOGGING_CATEGORY(sessionLog)

} // namespace homesync

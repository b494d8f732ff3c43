#include "sync_log.h"

namespace homesync {

Q_LOGGING_CATEGORY(pushLog, "homesync.push")
Q_LOGGING_CATEGORY(codecLog, "homesync.codec")
Q_LOGGING_CATEGORY(storeLog, "homesync.store")
Q_LOGGING_CATEGORY(pollLog, "homesync.poll")
Q_LOGGING_CATEGORY(writeLog, "homesync.write")
Q_LOGGING_CATEGORY(gatewayLog, "homesync.gateway")
Q_LOGGING_CATEGORY(sessionLog, "homesync.session")

} // namespace homesync

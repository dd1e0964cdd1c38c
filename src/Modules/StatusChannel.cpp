#include "StatusChannel.hpp"

#include "utils/logger.hpp"


namespace Modules {

const char* toString(StatusKind kind) {
    switch (kind) {
        case StatusKind::Connected:        return "connected";
        case StatusKind::ConnectFailed:    return "connect-failed";
        case StatusKind::Disconnected:     return "disconnected";
        case StatusKind::Reconnecting:     return "reconnecting";
        case StatusKind::Reconnected:      return "reconnected";
        case StatusKind::ReconnectFailed:  return "reconnect-failed";
        case StatusKind::Refreshing:       return "refreshing";
        case StatusKind::NotConnected:     return "not-connected";
        case StatusKind::ReadFailed:       return "read-failed";
        case StatusKind::SettingsApplied:  return "settings-applied";
        case StatusKind::SettingsRejected: return "settings-rejected";
    }
    return "unknown";
}


int displayDurationMs(StatusKind kind) {
    return (kind == StatusKind::Refreshing) ? 1000 : 2000;
}


void StatusChannel::emit(StatusKind kind, const std::string& detail) {
    int level = Logger::LOG_LVL_INFO;
    switch (kind) {
        case StatusKind::ConnectFailed:
        case StatusKind::ReconnectFailed:
        case StatusKind::SettingsRejected:
            level = Logger::LOG_LVL_WARN;
            break;

        // Repeats on every tick while the link is down
        case StatusKind::NotConnected:
            level = Logger::LOG_LVL_DEBUG;
            break;

        case StatusKind::ReadFailed:
            level = Logger::LOG_LVL_ERROR;
            break;

        default:
            break;
    }

    Logger::getLoggerInst()->log(level, "[%s] %s\r\n", toString(kind), detail.c_str());
    onStatus(StatusEvent{kind, detail});
}

} // namespace Modules

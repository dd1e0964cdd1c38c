#pragma once

#include <string>

#include <boost/signals2.hpp>


namespace Modules {

enum class StatusKind {
    Connected,
    ConnectFailed,
    Disconnected,
    Reconnecting,
    Reconnected,
    ReconnectFailed,
    Refreshing,
    NotConnected,
    ReadFailed,
    SettingsApplied,
    SettingsRejected
};

struct StatusEvent {
    StatusKind kind;
    std::string detail;  // Human readable message
};

const char* toString(StatusKind kind);

/**
 * @brief How long a presentation layer should keep a message on screen
 *
 * @param kind Event kind
 * @return int Milliseconds
 */
int displayDurationMs(StatusKind kind);

/**
 * @brief Single fan-out point for connection and data status events
 *
 * Every event is also written to the log, so a headless host needs no
 * subscriber of its own.
 */
class StatusChannel {
public:
    using Signal = boost::signals2::signal<void(const StatusEvent&)>;

    StatusChannel() = default;
    StatusChannel(const StatusChannel&) = delete;
    StatusChannel& operator=(const StatusChannel&) = delete;

    void emit(StatusKind kind, const std::string& detail);

    boost::signals2::connection subscribe(const Signal::slot_type& slot) {
        return onStatus.connect(slot);
    }

    Signal onStatus;
};

} // namespace Modules

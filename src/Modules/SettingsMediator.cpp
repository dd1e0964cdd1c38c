#include "SettingsMediator.hpp"

#include "Devices/SerialPort.hpp"
#include "utils/logger.hpp"


namespace Modules {

SettingsMediator::SettingsMediator(ConnectionManager& connection,
                                   Lib::UpdateScheduler& scheduler,
                                   StatusChannel& status)
    : m_Connection(connection), m_Scheduler(scheduler), m_Status(status) {
}


bool SettingsMediator::validate(const SettingsUpdate& update, std::string& reason) {
    if (update.port.has_value() && update.port->empty()) {
        reason = "port must not be empty";
        return false;
    }

    if (update.baudrate.has_value()) {
        speed_t speed;
        if (!Device::SerialPort::baudToSpeed(*update.baudrate, speed)) {
            reason = "unsupported baud rate " + std::to_string(*update.baudrate);
            return false;
        }
    }

    if (update.updateIntervalMs.has_value() && *update.updateIntervalMs <= 0) {
        reason = "update interval must be positive";
        return false;
    }

    if (update.reconnectIntervalMs.has_value() && *update.reconnectIntervalMs <= 0) {
        reason = "reconnect interval must be positive";
        return false;
    }

    return true;
}


bool SettingsMediator::apply(const SettingsUpdate& update) {
    std::string reason;
    if (!validate(update, reason)) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Settings rejected: %s\r\n", reason.c_str());
        m_Status.emit(StatusKind::SettingsRejected, "Settings rejected: " + reason);
        return false;
    }

    if (update.updateIntervalMs.has_value()) {
        m_Scheduler.setUpdateInterval(*update.updateIntervalMs);
    }
    if (update.reconnectIntervalMs.has_value()) {
        m_Scheduler.setReconnectInterval(*update.reconnectIntervalMs);
    }

    const bool connectionChanged = update.port.has_value() || update.baudrate.has_value();
    if (connectionChanged) {
        m_Connection.updateParams(update.port, update.baudrate);
        m_Status.emit(StatusKind::SettingsApplied, "Settings applied. Reconnecting to GPS...");
    } else {
        m_Status.emit(StatusKind::SettingsApplied, "Settings applied.");
    }

    return true;
}


SettingsMediator::Settings SettingsMediator::currentSettings(void) const {
    Settings settings;
    settings.port                = m_Connection.port();
    settings.baudrate            = m_Connection.baudrate();
    settings.updateIntervalMs    = m_Scheduler.updateInterval();
    settings.reconnectIntervalMs = m_Scheduler.reconnectInterval();
    return settings;
}

} // namespace Modules

#include "ConnectionManager.hpp"

#include <exception>

#include "Devices/SerialPort.hpp"
#include "gps_interface/gps_errors.hpp"
#include "utils/logger.hpp"


namespace Modules {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}


ConnectionManager::ConnectionManager(StatusChannel& status,
                                     const std::string& port,
                                     int baudrate,
                                     TransportFactory factory)
    : m_Status(status), m_Port(port), m_Baudrate(baudrate), m_Factory(std::move(factory)) {
    if (!m_Factory) {
        m_Factory = [this](const std::string& devPath, int baud) -> std::unique_ptr<Device::Transport> {
            return std::make_unique<Device::SerialPort>(devPath, baud, m_ReadTimeoutMs);
        };
    }
}


ConnectionManager::~ConnectionManager() {
    if (m_Session) {
        m_Session->close();
    }
}


ConnectionState ConnectionManager::state(void) const {
    if (m_Reconnecting.load()) {
        return ConnectionState::Reconnecting;
    }
    return m_Session ? ConnectionState::Connected : ConnectionState::Disconnected;
}


bool ConnectionManager::connect(void) {
    Logger* logger = Logger::getLoggerInst();

    if (m_Session) {
        disconnect();
    }

    try {
        std::unique_ptr<Device::Transport> transport = m_Factory(m_Port, m_Baudrate);
        if (!transport) {
            throw GPS::ConnectionError("no transport for " + m_Port);
        }
        m_Session = std::make_unique<GPS::GpsSession>(std::move(transport));
    } catch (const GPS::ConnectionError& e) {
        m_Session.reset();
        logger->log(Logger::LOG_LVL_ERROR, "Failed to connect to GPS: %s\r\n", e.what());
        m_Status.emit(StatusKind::ConnectFailed, std::string("GPS connection failed: ") + e.what());
        return false;
    } catch (const std::exception& e) {
        // Any other failure of an injected factory is reported the same way
        m_Session.reset();
        logger->log(Logger::LOG_LVL_ERROR, "Unexpected error connecting to GPS: %s\r\n", e.what());
        m_Status.emit(StatusKind::ConnectFailed, std::string("GPS connection failed: ") + e.what());
        return false;
    }

    logger->log(Logger::LOG_LVL_INFO, "GPS connected on %s at %d baud\r\n", m_Port.c_str(), m_Baudrate);
    m_Status.emit(StatusKind::Connected, "GPS connected successfully!");
    return true;
}


void ConnectionManager::disconnect(bool notify) {
    if (!m_Session) {
        return;
    }

    m_Session->close();
    m_Session.reset();
    if (notify) {
        m_Status.emit(StatusKind::Disconnected, "GPS disconnected");
    }
}


bool ConnectionManager::reconnect(void) {
    Logger* logger = Logger::getLoggerInst();

    if (m_Reconnecting.exchange(true)) {
        logger->log(Logger::LOG_LVL_DEBUG, "Reconnection already in progress\r\n");
        return false;
    }

    bool success = false;
    {
        // Release the guard even if the transport factory throws something unexpected
        struct GuardReset {
            std::atomic<bool>& flag;
            ~GuardReset() { flag.store(false); }
        } guardReset{m_Reconnecting};

        m_Status.emit(StatusKind::Reconnecting, "Attempting to reconnect to GPS...");
        logger->log(Logger::LOG_LVL_INFO, "Attempting GPS reconnection...\r\n");

        disconnect();
        success = connect();
    }

    if (success) {
        m_Status.emit(StatusKind::Reconnected, "GPS reconnected successfully!");
    } else {
        m_Status.emit(StatusKind::ReconnectFailed, "GPS reconnection failed");
    }

    return success;
}


void ConnectionManager::updateParams(std::optional<std::string> port, std::optional<int> baudrate) {
    if (port.has_value()) {
        m_Port = *port;
    }
    if (baudrate.has_value()) {
        m_Baudrate = *baudrate;
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Connection parameters updated: %s @ %d baud\r\n",
                                 m_Port.c_str(), m_Baudrate);
    reconnect();
}


void ConnectionManager::injectSession(std::unique_ptr<GPS::GpsSession> session) {
    m_Session = std::move(session);
}

} // namespace Modules

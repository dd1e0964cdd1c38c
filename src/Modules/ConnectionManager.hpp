#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "Devices/Transport.hpp"
#include "gps_interface/gps_session.hpp"
#include "StatusChannel.hpp"


namespace Modules {

enum class ConnectionState {
    Disconnected,
    Connected,
    Reconnecting
};

const char* toString(ConnectionState state);

/**
 * @brief Owns the live GPS session and its connect/disconnect/reconnect lifecycle
 */
class ConnectionManager {
public:
    using TransportFactory =
        std::function<std::unique_ptr<Device::Transport>(const std::string& port, int baudrate)>;

    /**
     * @brief Construct a connection manager
     *
     * @param status Channel receiving every state transition
     * @param port Serial device path
     * @param baudrate Serial speed
     * @param factory Opens a transport, throwing GPS::ConnectionError on failure.
     *                Defaults to a Device::SerialPort.
     */
    ConnectionManager(StatusChannel& status,
                      const std::string& port,
                      int baudrate,
                      TransportFactory factory = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open a session with the current port and baud rate
     *
     * Never throws. Failures are reported on the status channel.
     *
     * @return true Session opened
     */
    bool connect(void);

    /**
     * @brief Close and release the current session, if any
     *
     * @param notify Emit Disconnected. Callers that already reported the
     *               failure behind the disconnect pass false.
     */
    void disconnect(bool notify = true);

    /**
     * @brief Drop the current session and open a new one
     *
     * Only one reconnect may be in flight; a nested call returns false and
     * leaves the session alone.
     *
     * @return true New session opened
     */
    bool reconnect(void);

    /**
     * @brief Override connection parameters, then always reconnect
     *
     * @param port New port, or nullopt to keep the current one
     * @param baudrate New baud rate, or nullopt to keep the current one
     */
    void updateParams(std::optional<std::string> port, std::optional<int> baudrate);

    /**
     * @brief Install a pre-built session without going through connect()
     *
     * @param session Session to own; replaces any existing one without notification
     */
    void injectSession(std::unique_ptr<GPS::GpsSession> session);

    GPS::GpsSession* session(void) const { return m_Session.get(); }
    bool isConnected(void) const { return m_Session != nullptr; }
    bool isReconnecting(void) const { return m_Reconnecting.load(); }
    ConnectionState state(void) const;

    const std::string& port(void) const { return m_Port; }
    int baudrate(void) const { return m_Baudrate; }

    void setReadTimeout(int timeoutMs) { m_ReadTimeoutMs = timeoutMs; }

private:
    StatusChannel& m_Status;
    std::string m_Port;
    int m_Baudrate;
    int m_ReadTimeoutMs = 1000;
    TransportFactory m_Factory;

    std::unique_ptr<GPS::GpsSession> m_Session{nullptr};
    std::atomic<bool> m_Reconnecting{false};
};

} // namespace Modules

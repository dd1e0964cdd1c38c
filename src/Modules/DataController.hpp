#ifndef DATACONTROLLER_HPP
#define DATACONTROLLER_HPP

#include <optional>
#include <string>

#include "ConnectionManager.hpp"
#include "StatusChannel.hpp"
#include "gps_interface/gps_fix.hpp"


namespace Modules {

/**
 * @brief Read side facade over the connection manager
 *
 * Turns scheduler ticks into session drains and exposes copies of the fix.
 * Holds no state besides the last error.
 */
class DataController {
public:
    struct SatelliteInfo {
        std::optional<unsigned int> numSats;
        std::optional<GPS::GpsQuality> gpsQuality;
    };

    struct PositionInfo {
        std::optional<double> latitude;
        std::optional<double> longitude;
        std::optional<std::string> latDir;
        std::optional<std::string> lonDir;
        std::optional<double> height;
    };

    struct ValidationResult {
        bool valid = false;
        std::string reason;  // Empty when valid
    };

    DataController(ConnectionManager& connection, StatusChannel& status);
    ~DataController() {}

    /**
     * @brief Drain the session once
     *
     * A read failure is treated as a lost link: the connection manager is
     * disconnected so the reconnect path takes over.
     *
     * @return true Session drained
     */
    bool updateGpsData(void);

    /**
     * @brief User requested refresh; reconnects directly when disconnected
     *
     * @return true Refresh or reconnect succeeded
     */
    bool manualRefresh(void);

    ValidationResult validateExportData(void) const;

    std::optional<GPS::Fix> getCurrentData(void) const;
    SatelliteInfo getSatelliteInfo(void) const;
    PositionInfo getPositionInfo(void) const;

    bool isConnected(void) const { return m_Connection.isConnected(); }
    const std::optional<std::string>& lastError(void) const { return m_LastError; }

    static constexpr const char* NOT_CONNECTED_MSG = "The GPS Module is not connected.";

private:
    ConnectionManager& m_Connection;
    StatusChannel& m_Status;
    std::optional<std::string> m_LastError;
};

} // namespace Modules

#endif

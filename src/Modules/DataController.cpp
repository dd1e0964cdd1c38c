#include "DataController.hpp"

#include <boost/system/error_code.hpp>

#include "utils/logger.hpp"


namespace Modules {

DataController::DataController(ConnectionManager& connection, StatusChannel& status)
    : m_Connection(connection), m_Status(status) {
}


bool DataController::updateGpsData(void) {
    m_LastError.reset();

    GPS::GpsSession* session = m_Connection.session();
    if (!session) {
        m_LastError = NOT_CONNECTED_MSG;
        m_Status.emit(StatusKind::NotConnected, *m_LastError);
        return false;
    }

    boost::system::error_code ec;
    if (session->drainAvailable(ec) != GPS::GpsSession::SESSION_OK) {
        m_LastError = "GPS Error: Failed to read GPS serial port: " + ec.message();
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "GPS read error: %s\r\n", ec.message().c_str());
        m_Status.emit(StatusKind::ReadFailed, *m_LastError);

        // Lost link: drop the session so the reconnect path takes over. ReadFailed
        // is the one event for this failure, so the disconnect stays silent.
        m_Connection.disconnect(false);
        return false;
    }

    return true;
}


bool DataController::manualRefresh(void) {
    if (m_Connection.isConnected()) {
        m_Status.emit(StatusKind::Refreshing, "Refreshing GPS data...");
        return updateGpsData();
    }

    m_Status.emit(StatusKind::Reconnecting, "GPS not connected. Attempting reconnection...");
    return m_Connection.reconnect();
}


DataController::ValidationResult DataController::validateExportData(void) const {
    GPS::GpsSession* session = m_Connection.session();
    if (!session) {
        return {false, "No GPS data available to export."};
    }

    if (!session->fix().hasPosition()) {
        return {false, "GPS data is not valid or has no position information."};
    }

    return {true, ""};
}


std::optional<GPS::Fix> DataController::getCurrentData(void) const {
    GPS::GpsSession* session = m_Connection.session();
    if (!session) {
        return std::nullopt;
    }
    return session->snapshot();
}


DataController::SatelliteInfo DataController::getSatelliteInfo(void) const {
    SatelliteInfo info;
    GPS::GpsSession* session = m_Connection.session();
    if (session) {
        info.numSats    = session->fix().numSats;
        info.gpsQuality = session->fix().gpsQuality;
    }
    return info;
}


DataController::PositionInfo DataController::getPositionInfo(void) const {
    PositionInfo info;
    GPS::GpsSession* session = m_Connection.session();
    if (session) {
        const GPS::Fix fix = session->snapshot();
        info.latitude  = fix.latitude;
        info.longitude = fix.longitude;
        info.latDir    = fix.latDir;
        info.lonDir    = fix.lonDir;
        info.height    = fix.height;
    }
    return info;
}

} // namespace Modules

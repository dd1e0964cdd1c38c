#ifndef GPS_MONITOR_HPP
#define GPS_MONITOR_HPP

#include <boost/asio/io_context.hpp>
#include <boost/signals2.hpp>

#include "Modules/ConnectionManager.hpp"
#include "Modules/DataController.hpp"
#include "Modules/SettingsMediator.hpp"
#include "Modules/StatusChannel.hpp"
#include "gps_interface/gps_statistics.hpp"
#include "lib/UpdateScheduler.hpp"
#include "utils/config.hpp"


/**
 * @brief Wires the GPS components together and owns the polling policy
 *
 * A failed tick arms a deferred reconnect; a successful one samples the fix
 * into the statistics window.
 */
class GpsMonitor {
public:
    GpsMonitor(boost::asio::io_context& io_context,
               const Config::AppConfig& config,
               Modules::ConnectionManager::TransportFactory factory = nullptr);
    ~GpsMonitor();

    GpsMonitor(const GpsMonitor&) = delete;
    GpsMonitor& operator=(const GpsMonitor&) = delete;

    /**
     * @brief Connect (unless a session is already in place) and start polling
     *
     * A failed connect is not fatal, the reconnect timer takes over.
     */
    void start(void);
    void stop(void);

    bool manualRefresh(void);

    /**
     * @brief Push a reloaded config to the running components
     *
     * Only values that differ from the live ones are applied, so an unchanged
     * port does not force a reconnect.
     *
     * @param config Freshly loaded config
     * @return true Settings accepted
     */
    bool reloadConfig(const Config::AppConfig& config);

    Modules::StatusChannel& statusChannel(void) { return m_Status; }
    Modules::ConnectionManager& connection(void) { return m_Connection; }
    Modules::DataController& dataController(void) { return m_DataController; }
    Modules::SettingsMediator& settings(void) { return m_Settings; }
    Lib::UpdateScheduler& scheduler(void) { return m_Scheduler; }
    const GPS::GpsStatistics& statistics(void) const { return m_Statistics; }

    // Fired after each tick that produced a positioned fix
    boost::signals2::signal<void(const GPS::Fix&)> onFixUpdated;

private:
    void onUpdateTick(void);
    void onReconnectTick(void);

    Modules::StatusChannel m_Status;
    Modules::ConnectionManager m_Connection;
    Modules::DataController m_DataController;
    Lib::UpdateScheduler m_Scheduler;
    Modules::SettingsMediator m_Settings;
    GPS::GpsStatistics m_Statistics;
};


#endif

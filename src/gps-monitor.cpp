#include "gps-monitor.hpp"

#include <boost/bind/bind.hpp>

#include "utils/logger.hpp"


GpsMonitor::GpsMonitor(boost::asio::io_context& io_context,
                       const Config::AppConfig& config,
                       Modules::ConnectionManager::TransportFactory factory)
    : m_Connection(m_Status, config.port, config.baudrate, std::move(factory)),
      m_DataController(m_Connection, m_Status),
      m_Scheduler(io_context,
                  config.updateIntervalMs,
                  config.reconnectIntervalMs,
                  boost::bind(&GpsMonitor::onUpdateTick, this),
                  boost::bind(&GpsMonitor::onReconnectTick, this)),
      m_Settings(m_Connection, m_Scheduler, m_Status),
      m_Statistics(config.statisticsWindow) {
    m_Connection.setReadTimeout(config.readTimeoutMs);
}


GpsMonitor::~GpsMonitor() {
    stop();
}


void GpsMonitor::start(void) {
    if (!m_Connection.isConnected() && !m_Connection.connect()) {
        m_Scheduler.scheduleReconnect();
    }
    m_Scheduler.start();
}


void GpsMonitor::stop(void) {
    m_Scheduler.stop();
    m_Scheduler.cancelReconnect();
}


/**
 * @brief Scheduler tick: drain the session, then sample or recover
 */
void GpsMonitor::onUpdateTick(void) {
    if (m_DataController.updateGpsData()) {
        std::optional<GPS::Fix> fix = m_DataController.getCurrentData();
        if (fix.has_value() && fix->hasPosition()) {
            m_Statistics.push(*fix);
            onFixUpdated(*fix);
        }
        return;
    }

    if (!m_Connection.isReconnecting()) {
        m_Scheduler.scheduleReconnect();
    }
}


void GpsMonitor::onReconnectTick(void) {
    if (m_Connection.isConnected()) {
        return;
    }

    if (!m_Connection.reconnect()) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Reconnect failed, next attempt follows the next failed update\r\n");
    }
}


bool GpsMonitor::manualRefresh(void) {
    return m_DataController.manualRefresh();
}


bool GpsMonitor::reloadConfig(const Config::AppConfig& config) {
    Logger* logger = Logger::getLoggerInst();

    const int level = Logger::levelFromString(config.logLevel);
    if (level >= 0) {
        logger->setLevel(level);
    }
    m_Connection.setReadTimeout(config.readTimeoutMs);

    const Modules::SettingsMediator::Settings current = m_Settings.currentSettings();
    Modules::SettingsMediator::SettingsUpdate update;
    if (config.port != current.port) {
        update.port = config.port;
    }
    if (config.baudrate != current.baudrate) {
        update.baudrate = config.baudrate;
    }
    if (config.updateIntervalMs != current.updateIntervalMs) {
        update.updateIntervalMs = config.updateIntervalMs;
    }
    if (config.reconnectIntervalMs != current.reconnectIntervalMs) {
        update.reconnectIntervalMs = config.reconnectIntervalMs;
    }

    if (!m_Settings.apply(update)) {
        return false;
    }

    if (config.statisticsWindow != m_Statistics.capacity()) {
        logger->log(Logger::LOG_LVL_INFO, "Statistics window resized to %zu\r\n", config.statisticsWindow);
        m_Statistics = GPS::GpsStatistics(config.statisticsWindow);
    }

    return true;
}

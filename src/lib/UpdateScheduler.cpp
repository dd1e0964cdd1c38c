#include "UpdateScheduler.hpp"

#include <chrono>
#include <stdexcept>

#include <boost/asio/error.hpp>

#include "utils/logger.hpp"


namespace Lib {

UpdateScheduler::UpdateScheduler(boost::asio::io_context& io_context,
                                 int updateIntervalMs,
                                 int reconnectIntervalMs,
                                 Callback updateCallback,
                                 Callback reconnectCallback)
    : m_UpdateTimer(io_context),
      m_ReconnectTimer(io_context),
      m_UpdateIntervalMs(updateIntervalMs),
      m_ReconnectIntervalMs(reconnectIntervalMs),
      m_UpdateCallback(std::move(updateCallback)),
      m_ReconnectCallback(std::move(reconnectCallback)),
      m_AliveToken(std::make_shared<bool>(true)) {
    if (updateIntervalMs <= 0 || reconnectIntervalMs <= 0) {
        throw std::invalid_argument("Scheduler intervals must be positive");
    }
}


UpdateScheduler::~UpdateScheduler() {
    m_AliveToken.reset();
    m_Running = false;
    m_ReconnectPending = false;
    m_UpdateTimer.cancel();
    m_ReconnectTimer.cancel();
}


void UpdateScheduler::start(void) {
    if (m_Running) {
        return;
    }

    m_Running = true;
    m_UpdateGeneration++;
    armUpdateTimer();
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "GPS update scheduler started with %dms interval\r\n",
                                 m_UpdateIntervalMs);
}


void UpdateScheduler::stop(void) {
    if (!m_Running) {
        return;
    }

    m_Running = false;
    m_UpdateGeneration++;
    m_UpdateTimer.cancel();
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "GPS update scheduler stopped\r\n");
}


void UpdateScheduler::armUpdateTimer(void) {
    std::weak_ptr<bool> alive = m_AliveToken;
    const uint64_t generation = m_UpdateGeneration;

    m_UpdateTimer.expires_after(std::chrono::milliseconds(m_UpdateIntervalMs));
    m_UpdateTimer.async_wait([this, alive, generation](const boost::system::error_code& ec) {
        if (alive.expired() || ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (!m_Running || generation != m_UpdateGeneration) {
            return;
        }

        // Re-arm first so a callback that stops or re-times the scheduler has the last word
        armUpdateTimer();
        if (m_UpdateCallback) {
            m_UpdateCallback();
        }
    });
}


int UpdateScheduler::setUpdateInterval(int intervalMs) {
    if (intervalMs <= 0) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Rejected update interval %dms\r\n", intervalMs);
        return -1;
    }

    const bool wasRunning = m_Running;
    if (wasRunning) {
        m_Running = false;
        m_UpdateGeneration++;
        m_UpdateTimer.cancel();
    }

    m_UpdateIntervalMs = intervalMs;

    if (wasRunning) {
        m_Running = true;
        m_UpdateGeneration++;
        armUpdateTimer();
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Update interval changed to %dms\r\n", intervalMs);
    return 0;
}


int UpdateScheduler::setReconnectInterval(int intervalMs) {
    if (intervalMs <= 0) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Rejected reconnect interval %dms\r\n", intervalMs);
        return -1;
    }

    m_ReconnectIntervalMs = intervalMs;
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Reconnect interval changed to %dms\r\n", intervalMs);
    return 0;
}


bool UpdateScheduler::scheduleReconnect(void) {
    if (m_ReconnectPending) {
        return false;
    }

    m_ReconnectPending = true;
    const uint64_t generation = ++m_ReconnectGeneration;
    std::weak_ptr<bool> alive = m_AliveToken;

    m_ReconnectTimer.expires_after(std::chrono::milliseconds(m_ReconnectIntervalMs));
    m_ReconnectTimer.async_wait([this, alive, generation](const boost::system::error_code& ec) {
        if (alive.expired() || ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (!m_ReconnectPending || generation != m_ReconnectGeneration) {
            return;
        }

        // Clear before calling out so the callback may schedule the next attempt
        m_ReconnectPending = false;
        if (m_ReconnectCallback) {
            m_ReconnectCallback();
        }
    });

    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Reconnection scheduled in %dms\r\n",
                                 m_ReconnectIntervalMs);
    return true;
}


void UpdateScheduler::cancelReconnect(void) {
    if (!m_ReconnectPending) {
        return;
    }

    m_ReconnectPending = false;
    m_ReconnectGeneration++;
    m_ReconnectTimer.cancel();
    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Pending reconnection cancelled\r\n");
}

} // namespace Lib

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>


namespace Lib {

/**
 * @brief Periodic update timer plus a one-shot deferred reconnect, on an io_context
 *
 * Both callbacks run on the thread that runs the io_context; nothing here
 * spawns a thread.
 */
class UpdateScheduler {
public:
    using Callback = std::function<void()>;

    /**
     * @brief Construct a scheduler (stopped)
     *
     * @param io_context Context the timers run on
     * @param updateIntervalMs Period of the update callback
     * @param reconnectIntervalMs Delay before a scheduled reconnect fires
     * @param updateCallback Called every update period while running
     * @param reconnectCallback Called once per scheduleReconnect()
     * @throws std::invalid_argument if an interval is not positive
     */
    UpdateScheduler(boost::asio::io_context& io_context,
                    int updateIntervalMs,
                    int reconnectIntervalMs,
                    Callback updateCallback,
                    Callback reconnectCallback);
    ~UpdateScheduler();

    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;

    void start(void);

    /**
     * @brief Stop the periodic timer; no update callback fires afterwards
     *
     * A pending reconnect is left armed, use cancelReconnect() for that.
     */
    void stop(void);

    bool isRunning(void) const { return m_Running; }

    /**
     * @brief Change the update period, restarting the timer if it is running
     *
     * @param intervalMs New period in milliseconds
     * @return int 0 on success, -1 if the interval is not positive
     */
    int setUpdateInterval(int intervalMs);

    /**
     * @brief Change the delay used by the next scheduleReconnect()
     *
     * @param intervalMs New delay in milliseconds
     * @return int 0 on success, -1 if the interval is not positive
     */
    int setReconnectInterval(int intervalMs);

    int updateInterval(void) const { return m_UpdateIntervalMs; }
    int reconnectInterval(void) const { return m_ReconnectIntervalMs; }

    /**
     * @brief Arm the one-shot reconnect timer
     *
     * Idempotent: while an attempt is pending further calls do nothing, so
     * repeated failures cannot stack reconnect attempts.
     *
     * @return true A new attempt was armed
     */
    bool scheduleReconnect(void);
    void cancelReconnect(void);
    bool isReconnectPending(void) const { return m_ReconnectPending; }

private:
    void armUpdateTimer(void);

    boost::asio::steady_timer m_UpdateTimer;
    boost::asio::steady_timer m_ReconnectTimer;

    int m_UpdateIntervalMs;
    int m_ReconnectIntervalMs;

    Callback m_UpdateCallback;
    Callback m_ReconnectCallback;

    bool m_Running = false;
    bool m_ReconnectPending = false;

    // Bumped on every stop/cancel so handlers already queued by asio become no-ops
    uint64_t m_UpdateGeneration = 0;
    uint64_t m_ReconnectGeneration = 0;

    // Handlers hold a weak reference and bail out once the scheduler is gone
    std::shared_ptr<bool> m_AliveToken;
};

} // namespace Lib

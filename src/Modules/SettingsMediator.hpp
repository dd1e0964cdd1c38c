#ifndef SETTINGSMEDIATOR_HPP
#define SETTINGSMEDIATOR_HPP

#include <optional>
#include <string>

#include "ConnectionManager.hpp"
#include "StatusChannel.hpp"
#include "lib/UpdateScheduler.hpp"


namespace Modules {

/**
 * @brief Applies user settings to the scheduler and the connection manager
 */
class SettingsMediator {
public:
    struct Settings {
        std::string port;
        int baudrate;
        int updateIntervalMs;
        int reconnectIntervalMs;
    };

    // Fields left empty are not touched
    struct SettingsUpdate {
        std::optional<std::string> port;
        std::optional<int> baudrate;
        std::optional<int> updateIntervalMs;
        std::optional<int> reconnectIntervalMs;
    };

    SettingsMediator(ConnectionManager& connection, Lib::UpdateScheduler& scheduler, StatusChannel& status);
    ~SettingsMediator() {}

    /**
     * @brief Validate then apply an update as a single transaction
     *
     * Nothing changes unless every provided value is valid. A port or baud
     * rate change reconnects the GPS.
     *
     * @param update Values to change
     * @return true Update applied
     */
    bool apply(const SettingsUpdate& update);

    Settings currentSettings(void) const;

    /**
     * @brief Check an update without applying it
     *
     * @param update Values to check
     * @param reason Set to the first problem found
     * @return true All provided values are valid
     */
    static bool validate(const SettingsUpdate& update, std::string& reason);

private:
    ConnectionManager& m_Connection;
    Lib::UpdateScheduler& m_Scheduler;
    StatusChannel& m_Status;
};

} // namespace Modules

#endif

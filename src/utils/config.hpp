#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>


namespace Config {

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/gps-monitor/config.json";

struct AppConfig {
    std::string port        = "/dev/ttyUSB0";
    int baudrate            = 9600;
    int updateIntervalMs    = 100;
    int reconnectIntervalMs = 5000;
    int readTimeoutMs       = 1000;
    size_t statisticsWindow = 10;
    std::string logLevel    = "info";
};

enum {
    CONFIG_OK        =  0,
    CONFIG_ERR_IO    = -1,
    CONFIG_ERR_PARSE = -2
};

/**
 * @brief Overlay a JSON config file onto a config
 *
 * A missing file is not an error and leaves the config untouched.
 *
 * @param path Path to the JSON file
 * @param config Config to update
 * @return int CONFIG_OK, CONFIG_ERR_IO if the file exists but cannot be read,
 *         CONFIG_ERR_PARSE if it is not a JSON object
 */
int loadFile(const std::string& path, AppConfig& config);

/**
 * @brief Overlay the keys of a parsed JSON object onto a config
 *
 * Invalid values are logged and skipped.
 *
 * @param root Parsed document
 * @param config Config to update
 * @return int Number of values rejected
 */
int applyJson(const nlohmann::json& root, AppConfig& config);

/**
 * @brief Overlay GPS_PORT, GPS_BAUDRATE, GPS_UPDATE_INTERVAL_MS and GPS_RECONNECT_INTERVAL_MS
 *
 * @param config Config to update
 * @return int Number of values rejected
 */
int applyEnvironment(AppConfig& config);

/**
 * @brief Defaults, then the file, then the environment
 *
 * @param path Path to the JSON file
 * @return AppConfig Resulting config
 */
AppConfig load(const std::string& path);

} // namespace Config

#endif

#include "config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

#include <sys/stat.h>

#include "Devices/SerialPort.hpp"
#include "utils/logger.hpp"


namespace Config {

namespace {

bool isSupportedBaud(int baud) {
    speed_t speed;
    return Device::SerialPort::baudToSpeed(baud, speed);
}


/**
 * @brief Strict decimal parse, the whole string must be consumed
 */
bool parseInt(const char* text, int& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return false;
    }

    out = static_cast<int>(value);
    return true;
}


bool readPositiveInt(const nlohmann::json& root, const char* key, int& out) {
    const nlohmann::json& value = root[key];
    if (!value.is_number_integer() || value.get<long long>() <= 0 || value.get<long long>() > INT_MAX) {
        return false;
    }
    out = value.get<int>();
    return true;
}


void reject(const char* source, const char* key) {
    Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Ignoring invalid %s value for '%s'\r\n", source, key);
}

} // namespace


int applyJson(const nlohmann::json& root, AppConfig& config) {
    int rejected = 0;

    if (root.contains("port")) {
        if (root["port"].is_string() && !root["port"].get<std::string>().empty()) {
            config.port = root["port"].get<std::string>();
        } else {
            reject("config", "port");
            rejected++;
        }
    }

    if (root.contains("baudrate")) {
        int baud = 0;
        if (readPositiveInt(root, "baudrate", baud) && isSupportedBaud(baud)) {
            config.baudrate = baud;
        } else {
            reject("config", "baudrate");
            rejected++;
        }
    }

    struct IntKey {
        const char* key;
        int* field;
    };
    const IntKey intervals[] = {
        {"update_interval_ms",    &config.updateIntervalMs},
        {"reconnect_interval_ms", &config.reconnectIntervalMs},
        {"read_timeout_ms",       &config.readTimeoutMs},
    };

    for (const IntKey& entry : intervals) {
        if (!root.contains(entry.key)) {
            continue;
        }
        int value = 0;
        if (readPositiveInt(root, entry.key, value)) {
            *entry.field = value;
        } else {
            reject("config", entry.key);
            rejected++;
        }
    }

    if (root.contains("statistics_window")) {
        int window = 0;
        if (readPositiveInt(root, "statistics_window", window)) {
            config.statisticsWindow = static_cast<size_t>(window);
        } else {
            reject("config", "statistics_window");
            rejected++;
        }
    }

    if (root.contains("log_level")) {
        if (root["log_level"].is_string() && Logger::levelFromString(root["log_level"].get<std::string>()) >= 0) {
            config.logLevel = root["log_level"].get<std::string>();
        } else {
            reject("config", "log_level");
            rejected++;
        }
    }

    return rejected;
}


int loadFile(const std::string& path, AppConfig& config) {
    Logger* logger = Logger::getLoggerInst();

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        logger->log(Logger::LOG_LVL_INFO, "No config file at %s, using defaults\r\n", path.c_str());
        return CONFIG_OK;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        logger->log(Logger::LOG_LVL_ERROR, "Unable to open config file %s\r\n", path.c_str());
        return CONFIG_ERR_IO;
    }

    nlohmann::json root = nlohmann::json::parse(file, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        logger->log(Logger::LOG_LVL_ERROR, "Config file %s is not a valid JSON object\r\n", path.c_str());
        return CONFIG_ERR_PARSE;
    }

    applyJson(root, config);
    logger->log(Logger::LOG_LVL_INFO, "Loaded config from %s\r\n", path.c_str());
    return CONFIG_OK;
}


int applyEnvironment(AppConfig& config) {
    int rejected = 0;

    const char* port = std::getenv("GPS_PORT");
    if (port != nullptr) {
        if (*port != '\0') {
            config.port = port;
        } else {
            reject("environment", "GPS_PORT");
            rejected++;
        }
    }

    const char* baudText = std::getenv("GPS_BAUDRATE");
    if (baudText != nullptr) {
        int baud = 0;
        if (parseInt(baudText, baud) && isSupportedBaud(baud)) {
            config.baudrate = baud;
        } else {
            reject("environment", "GPS_BAUDRATE");
            rejected++;
        }
    }

    struct EnvKey {
        const char* name;
        int* field;
    };
    const EnvKey intervals[] = {
        {"GPS_UPDATE_INTERVAL_MS",    &config.updateIntervalMs},
        {"GPS_RECONNECT_INTERVAL_MS", &config.reconnectIntervalMs},
    };

    for (const EnvKey& entry : intervals) {
        const char* text = std::getenv(entry.name);
        if (text == nullptr) {
            continue;
        }
        int value = 0;
        if (parseInt(text, value) && value > 0) {
            *entry.field = value;
        } else {
            reject("environment", entry.name);
            rejected++;
        }
    }

    return rejected;
}


AppConfig load(const std::string& path) {
    AppConfig config;
    if (loadFile(path, config) != CONFIG_OK) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Falling back to default settings\r\n");
        config = AppConfig();
    }
    applyEnvironment(config);
    return config;
}

} // namespace Config

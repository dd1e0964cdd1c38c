#include <string>
#include <cstdarg>
#include <stdio.h>
#include <strings.h>
#include <systemd/sd-journal.h>
#include <syslog.h>
#include <ctime>

#include "logger.hpp"


#define INFO_PREPEND  "[INFO]"
#define WARN_PREPEND  "[WARN]"
#define ERR_PREPEND   "[ERROR]"
#define DEBUG_PREPEND "[DEBUG]"


Logger* logInstance = nullptr;

Logger* Logger::getLoggerInst(void) {
    static std::once_flag instanceFlag;
    std::call_once(instanceFlag, []() {
        logInstance = new Logger();
    });

    return logInstance;
}


/**
 * @brief Rank a level so that lower values are more severe
 *
 * @param logLvl One of the LOG_LVL_* values
 * @return int Severity rank
 */
int Logger::severity(int logLvl) {
    switch (logLvl) {
        case Logger::LOG_LVL_ERROR: return 0;
        case Logger::LOG_LVL_WARN:  return 1;
        case Logger::LOG_LVL_INFO:  return 2;
        case Logger::LOG_LVL_DEBUG: return 3;
        default:                    return 2;
    }
}


void Logger::setLevel(int logLvl) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Level = logLvl;
}


int Logger::levelFromString(const std::string& name) {
    if (!strcasecmp(name.c_str(), "info"))  return LOG_LVL_INFO;
    if (!strcasecmp(name.c_str(), "warn") ||
        !strcasecmp(name.c_str(), "warning")) return LOG_LVL_WARN;
    if (!strcasecmp(name.c_str(), "error")) return LOG_LVL_ERROR;
    if (!strcasecmp(name.c_str(), "debug")) return LOG_LVL_DEBUG;
    return -1;
}


void Logger::log(int logLvl, const char* format, ...) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (severity(logLvl) > severity(m_Level)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    std::time_t currentTime = std::time(nullptr);
    std::tm localTime{};
    localtime_r(&currentTime, &localTime);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &localTime);

    int level = LOG_INFO;
    const char* prepend = INFO_PREPEND;

    switch (logLvl) {
        case Logger::LOG_LVL_INFO:
            level = LOG_INFO;
            prepend = INFO_PREPEND;
            break;

        case Logger::LOG_LVL_WARN:
            level = LOG_WARNING;
            prepend = WARN_PREPEND;
            break;

        case Logger::LOG_LVL_ERROR:
            level = LOG_ERR;
            prepend = ERR_PREPEND;
            break;

        case Logger::LOG_LVL_DEBUG:
            level = LOG_DEBUG;
            prepend = DEBUG_PREPEND;
            break;

        default:
            break;
    }

    std::string message = std::string(ts) + " " + prepend + " " + buffer;
    if (m_JournalEnabled) {
        sd_journal_print(level, "%s", buffer);
    }
    printf("%s", message.c_str());
    fflush(stdout);
}

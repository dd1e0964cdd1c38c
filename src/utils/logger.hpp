#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <cstdarg>
#include <mutex>
#include <string>


class Logger {
public:
    Logger() {}
    ~Logger() {}

    static Logger* getLoggerInst(void);
    void log(int logLvl, const char* format, ...) __attribute__((format(printf, 3, 4)));

    /**
     * @brief Set the most verbose level that is still emitted
     *
     * @param logLvl One of the LOG_LVL_* values
     */
    void setLevel(int logLvl);

    /**
     * @brief Mirror messages to the systemd journal
     *
     * @param enabled Journal output state
     */
    void setJournalEnabled(bool enabled) { m_JournalEnabled = enabled; }

    /**
     * @brief Parse a level name ("info", "warn", "error", "debug")
     *
     * @param name Level name, case insensitive
     * @return int LOG_LVL_* value, or -1 if the name is unknown
     */
    static int levelFromString(const std::string& name);
public:
    enum {
        LOG_LVL_INFO,
        LOG_LVL_WARN,
        LOG_LVL_ERROR,
        LOG_LVL_DEBUG
    };

private:
    static int severity(int logLvl);

    int m_Level = LOG_LVL_INFO;
    bool m_JournalEnabled = true;
    std::mutex m_Mutex;
};

#endif

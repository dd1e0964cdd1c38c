#include <csignal>
#include <cstdio>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "gps-monitor.hpp"
#include "gps_interface/gps_fix.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "version.h"


static void printUsage(const char* prog) {
    printf("Usage: %s [--config <path>]\r\n", prog);
    printf("  --config <path>  JSON settings file (default %s)\r\n", Config::DEFAULT_CONFIG_PATH);
}


static void logStatistics(const GPS::GpsStatistics& statistics) {
    Logger* logger = Logger::getLoggerInst();
    if (statistics.empty()) {
        logger->log(Logger::LOG_LVL_INFO, "No fixes sampled yet\r\n");
        return;
    }

    GPS::GpsStatistics::FieldStats mean   = statistics.mean();
    GPS::GpsStatistics::FieldStats median = statistics.median();
    logger->log(Logger::LOG_LVL_INFO, "Window %zu/%zu: mean %.6f, %.6f @ %.1fm, median %.6f, %.6f @ %.1fm\r\n",
                statistics.size(), statistics.capacity(),
                mean.latitude.value_or(0.0), mean.longitude.value_or(0.0), mean.height.value_or(0.0),
                median.latitude.value_or(0.0), median.longitude.value_or(0.0), median.height.value_or(0.0));
}


int main(int argc, char* argv[]) {
    Logger* logger = Logger::getLoggerInst();
    logger->log(Logger::LOG_LVL_INFO, "GPS monitor V%d.%d.%d\r\n",
                GPS_MONITOR_VERSION_MAJOR, GPS_MONITOR_VERSION_MINOR, GPS_MONITOR_VERSION_BUILD);

    std::string configPath = Config::DEFAULT_CONFIG_PATH;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            logger->log(Logger::LOG_LVL_ERROR, "Unknown argument: %s\r\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    Config::AppConfig config = Config::load(configPath);
    logger->setLevel(Logger::levelFromString(config.logLevel));

    boost::asio::io_context io_context;
    GpsMonitor monitor(io_context, config);

    monitor.onFixUpdated.connect([logger](const GPS::Fix& fix) {
        logger->log(Logger::LOG_LVL_DEBUG, "Fix: %s\r\n", GPS::toJson(fix).dump().c_str());
    });

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM, SIGHUP);
    signals.add(SIGUSR1);

    std::function<void(const boost::system::error_code&, int)> onSignal;
    onSignal = [&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }

        switch (signo) {
            case SIGHUP:
                logger->log(Logger::LOG_LVL_INFO, "Reloading settings from %s\r\n", configPath.c_str());
                if (!monitor.reloadConfig(Config::load(configPath))) {
                    logger->log(Logger::LOG_LVL_WARN, "Reload rejected, keeping previous settings\r\n");
                }
                break;

            case SIGUSR1:
                if (!monitor.manualRefresh()) {
                    logger->log(Logger::LOG_LVL_WARN, "Manual refresh failed\r\n");
                }
                logStatistics(monitor.statistics());
                break;

            default:
                logger->log(Logger::LOG_LVL_INFO, "Received signal %d, shutting down\r\n", signo);
                monitor.stop();
                monitor.connection().disconnect();
                io_context.stop();
                return;
        }

        signals.async_wait(onSignal);
    };
    signals.async_wait(onSignal);

    monitor.start();
    io_context.run();

    return 0;
}

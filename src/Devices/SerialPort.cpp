#include "SerialPort.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <boost/asio/error.hpp>

#include "gps_interface/gps_errors.hpp"
#include "utils/logger.hpp"


namespace Device {

SerialPort::SerialPort(const std::string& devPath, int baud, int timeoutMs)
    : m_DevPath(devPath), m_TimeoutMs(timeoutMs) {
    std::string reason;
    if (openPort(baud, reason) < 0) {
        throw GPS::ConnectionError("Failed to open serial port " + devPath + ": " + reason);
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Serial port %s opened at %d baud\r\n",
                                 devPath.c_str(), baud);
}


SerialPort::~SerialPort() {
    close();
}


bool SerialPort::baudToSpeed(int baud, speed_t& speed) {
    switch (baud) {
        case 1200:   speed = B1200;   return true;
        case 2400:   speed = B2400;   return true;
        case 4800:   speed = B4800;   return true;
        case 9600:   speed = B9600;   return true;
        case 19200:  speed = B19200;  return true;
        case 38400:  speed = B38400;  return true;
        case 57600:  speed = B57600;  return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        case 460800: speed = B460800; return true;
        case 921600: speed = B921600; return true;
        default:                      return false;
    }
}


/**
 * @brief Open the GPS device port
 *
 * @param baud Baud rate for the serial communication
 * @param reason Failure description
 * @return int 0 on success, -1 on failure
 */
int SerialPort::openPort(int baud, std::string& reason) {
    speed_t speed;
    if (!baudToSpeed(baud, speed)) {
        reason = "unsupported baud rate " + std::to_string(baud);
        return -1;
    }

    int flags = O_RDWR | O_NOCTTY | O_NONBLOCK;
    m_Fd = ::open(m_DevPath.c_str(), flags);
    if (m_Fd < 0 && errno == EINTR) {
        // Retry if interrupted by signal
        m_Fd = ::open(m_DevPath.c_str(), flags);
    }
    if (m_Fd < 0) {
        reason = std::strerror(errno);
        return -1;
    }

    termios options{};
    if (tcgetattr(m_Fd, &options) != 0) {
        reason = std::string("tcgetattr: ") + std::strerror(errno);
        close();
        return -1;
    }

    cfmakeraw(&options);
    if (cfsetispeed(&options, speed) != 0 || cfsetospeed(&options, speed) != 0) {
        reason = "baud rate " + std::to_string(baud) + " rejected by driver";
        close();
        return -1;
    }
    options.c_cflag |= (CLOCAL | CREAD);
    options.c_cflag &= ~PARENB;  // no parity
    options.c_cflag &= ~CSTOPB;  // 1 stop bit
    options.c_cflag &= ~CSIZE;
    options.c_cflag |= CS8;      // 8 data bits
    options.c_cflag &= ~CRTSCTS; // no hardware flow control
    options.c_cc[VMIN]  = 0;
    options.c_cc[VTIME] = 0;

    if (tcsetattr(m_Fd, TCSANOW, &options) != 0) {
        reason = std::string("tcsetattr: ") + std::strerror(errno);
        close();
        return -1;
    }

    tcflush(m_Fd, TCIFLUSH);
    return 0;
}


/**
 * @brief Wait for data and append whatever arrives to the receive buffer
 *
 * @param timeoutMs Time to wait for the descriptor to become readable
 * @param ec Set on I/O failure
 * @return int Number of bytes appended (0 on timeout), or -1 on error
 */
int SerialPort::fillBuffer(int timeoutMs, boost::system::error_code& ec) {
    pollfd pfd{};
    pfd.fd = m_Fd;
    pfd.events = POLLIN;

    int ret = ::poll(&pfd, 1, timeoutMs);
    if (ret < 0) {
        if (errno == EINTR) {
            return 0;
        }
        ec = boost::system::error_code(errno, boost::system::system_category());
        return -1;
    }

    if (ret == 0) {
        return 0;
    }

    if ((pfd.revents & (POLLERR | POLLNVAL)) ||
        ((pfd.revents & POLLHUP) && !(pfd.revents & POLLIN))) {
        ec = boost::asio::error::connection_reset;
        return -1;
    }

    char chunk[READ_CHUNK];
    ssize_t n = ::read(m_Fd, chunk, sizeof(chunk));
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0; // nothing yet
        ec = boost::system::error_code(errno, boost::system::system_category());
        return -1;
    }

    if (n == 0) {
        // Readable but empty: the device went away
        ec = boost::asio::error::eof;
        return -1;
    }

    m_RxBuffer.append(chunk, static_cast<size_t>(n));
    return static_cast<int>(n);
}


int SerialPort::readLine(std::string& line, boost::system::error_code& ec) {
    line.clear();
    if (!isOpen()) {
        ec = boost::asio::error::bad_descriptor;
        return -1;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_TimeoutMs);
    while (true) {
        auto newlinePos = m_RxBuffer.find('\n');
        if (newlinePos != std::string::npos) {
            line = m_RxBuffer.substr(0, newlinePos + 1);
            m_RxBuffer.erase(0, newlinePos + 1);
            return static_cast<int>(line.size());
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        if (fillBuffer(static_cast<int>(remaining), ec) < 0) {
            return -1;
        }
    }

    // Timed out without a terminator: hand out the partial line
    line.swap(m_RxBuffer);
    m_RxBuffer.clear();
    return static_cast<int>(line.size());
}


int SerialPort::bytesWaiting(boost::system::error_code& ec) {
    if (!isOpen()) {
        ec = boost::asio::error::bad_descriptor;
        return -1;
    }

    int pending = 0;
    if (::ioctl(m_Fd, FIONREAD, &pending) < 0) {
        ec = boost::system::error_code(errno, boost::system::system_category());
        return -1;
    }

    return pending + static_cast<int>(m_RxBuffer.size());
}


void SerialPort::close() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
        m_RxBuffer.clear();
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Serial port %s closed\r\n", m_DevPath.c_str());
    }
}

} // namespace Device

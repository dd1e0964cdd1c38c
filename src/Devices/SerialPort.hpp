#ifndef SERIALPORT_HPP
#define SERIALPORT_HPP

#include <string>
#include <termios.h>

#include "Transport.hpp"


namespace Device {

class SerialPort : public Transport {
public:
    /**
     * @brief Open and configure a serial device (8N1, raw)
     *
     * @param devPath Path to the device, e.g. /dev/ttyUSB0
     * @param baud Baud rate
     * @param timeoutMs Upper bound for a single readLine call
     * @throws GPS::ConnectionError if the device cannot be opened or the baud rate is rejected
     */
    SerialPort(const std::string& devPath, int baud = 9600, int timeoutMs = 1000);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    int readLine(std::string& line, boost::system::error_code& ec) override;
    int bytesWaiting(boost::system::error_code& ec) override;
    bool isOpen() const override { return m_Fd >= 0; }
    void close() override;

    /**
     * @brief Map a numeric baud rate to its termios constant
     *
     * @param baud Baud rate
     * @param speed Output termios speed
     * @return true The rate is supported
     */
    static bool baudToSpeed(int baud, speed_t& speed);

protected:
    int openPort(int baud, std::string& reason);
    int fillBuffer(int timeoutMs, boost::system::error_code& ec);

    static constexpr size_t READ_CHUNK = 256;

    std::string m_DevPath;
    std::string m_RxBuffer;  // Bytes read from the device but not yet handed out
    int m_TimeoutMs = 1000;
    int m_Fd = -1;
};

} // namespace Device

#endif

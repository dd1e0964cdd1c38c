#pragma once

#include <string>

#include <boost/system/error_code.hpp>


namespace Device {

/**
 * @brief Byte level link to a line oriented device
 *
 * Implementations never throw from the read path; I/O failures are reported
 * through the error code so the caller can decide whether the link is lost.
 */
class Transport {
public:
    virtual ~Transport() {}

    /**
     * @brief Read one line, waiting up to the transport timeout for a terminator
     *
     * On timeout, whatever is buffered (possibly nothing) is returned.
     *
     * @param line Receives the raw bytes, terminator included when present
     * @param ec Set on I/O failure
     * @return int Bytes consumed, or -1 on error
     */
    virtual int readLine(std::string& line, boost::system::error_code& ec) = 0;

    /**
     * @brief Number of bytes that can be read without blocking
     *
     * @param ec Set on I/O failure
     * @return int Byte count, or -1 on error
     */
    virtual int bytesWaiting(boost::system::error_code& ec) = 0;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

} // namespace Device

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/system/error_code.hpp>

#include "Devices/Transport.hpp"
#include "gps_fix.hpp"
#include "nmea_decoder.hpp"


namespace GPS {

/**
 * @brief One live link to a receiver: transport, decoder and the fix they feed
 *
 * The session is the only writer of its fix. Everyone else reads copies.
 */
class GpsSession {
public:
    explicit GpsSession(std::unique_ptr<Device::Transport> transport);
    ~GpsSession();

    GpsSession(const GpsSession&) = delete;
    GpsSession& operator=(const GpsSession&) = delete;

    enum {
        SESSION_OK              =  0,
        SESSION_ERR_READ_FAILED = -1
    };

    struct Stats {
        size_t applied     = 0;  // Sentences written to the fix
        size_t ignored     = 0;  // Foreign talkers or undecoded types
        size_t rejected    = 0;  // Malformed or bad checksum
        size_t badEncoding = 0;  // Lines dropped before decoding
    };

    /**
     * @brief Consume every line the transport currently holds
     *
     * The byte count reported at entry bounds the cycle, so a receiver that
     * streams continuously cannot keep the caller here forever. Bad sentences
     * are counted and skipped.
     *
     * @param ec Transport error when the read fails
     * @return int SESSION_OK, or SESSION_ERR_READ_FAILED if the link should be considered lost
     */
    int drainAvailable(boost::system::error_code& ec);

    const Fix& fix() const { return m_Fix; }
    Fix snapshot() const { return m_Fix; }
    const Stats& stats() const { return m_Stats; }

    bool isOpen() const;
    void close();

    static bool isValidUtf8(const std::string& text);

private:
    std::unique_ptr<Device::Transport> m_Transport;
    NmeaDecoder m_Decoder;
    Fix m_Fix;
    Stats m_Stats;
};

} // namespace GPS

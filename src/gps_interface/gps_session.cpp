#include "gps_session.hpp"

#include <stdexcept>

#include <boost/algorithm/string/trim.hpp>

#include "utils/logger.hpp"


namespace GPS {

GpsSession::GpsSession(std::unique_ptr<Device::Transport> transport)
    : m_Transport(std::move(transport)) {
    if (!m_Transport) {
        throw std::invalid_argument("GpsSession requires a transport");
    }
}


GpsSession::~GpsSession() {
    close();
}


bool GpsSession::isOpen() const {
    return m_Transport->isOpen();
}


void GpsSession::close() {
    if (m_Transport->isOpen()) {
        m_Transport->close();
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG,
            "GPS session closed (applied %zu, ignored %zu, rejected %zu, bad encoding %zu)\r\n",
            m_Stats.applied, m_Stats.ignored, m_Stats.rejected, m_Stats.badEncoding);
    }
}


int GpsSession::drainAvailable(boost::system::error_code& ec) {
    Logger* logger = Logger::getLoggerInst();
    ec.clear();

    auto readFailed = [&]() {
        logger->log(Logger::LOG_LVL_ERROR, "Error reading serial port: %s\r\n", ec.message().c_str());
        return SESSION_ERR_READ_FAILED;
    };

    const int budget = m_Transport->bytesWaiting(ec);
    if (budget < 0) {
        return readFailed();
    }

    int consumed = 0;
    std::string line;
    while (consumed < budget) {
        int waiting = m_Transport->bytesWaiting(ec);
        if (waiting < 0) {
            return readFailed();
        }
        if (waiting == 0) {
            break;
        }

        int n = m_Transport->readLine(line, ec);
        if (n < 0) {
            return readFailed();
        }
        if (n == 0) {
            break;
        }
        consumed += n;

        if (!isValidUtf8(line)) {
            m_Stats.badEncoding++;
            logger->log(Logger::LOG_LVL_ERROR, "Error decoding NMEA: invalid UTF-8 in %d byte line\r\n", n);
            continue;
        }

        boost::algorithm::trim(line);
        if (line.empty()) {
            continue;
        }

        int ret = m_Decoder.apply(line, m_Fix);
        switch (ret) {
            case NmeaDecoder::DECODE_APPLIED:
                m_Stats.applied++;
                break;

            case NmeaDecoder::DECODE_IGNORED:
                m_Stats.ignored++;
                break;

            case NmeaDecoder::DECODE_ERR_MALFORMED:
                m_Stats.rejected++;
                logger->log(Logger::LOG_LVL_DEBUG, "Malformed NMEA sentence: %s\r\n", line.c_str());
                break;

            case NmeaDecoder::DECODE_ERR_CHECKSUM:
                m_Stats.rejected++;
                logger->log(Logger::LOG_LVL_DEBUG, "Bad NMEA checksum: %s\r\n", line.c_str());
                break;

            default:
                logger->log(Logger::LOG_LVL_WARN, "Unrecognized decoder status, code: %d\r\n", ret);
                break;
        }
    }

    return SESSION_OK;
}


/**
 * @brief Check that a byte string is well formed UTF-8
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 */
bool GpsSession::isValidUtf8(const std::string& text) {
    size_t i = 0;
    const size_t len = text.size();
    while (i < len) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        unsigned int codePoint = 0;

        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= len) {
            return false;
        }

        for (size_t k = 1; k <= extra; k++) {
            const unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (cc & 0x3F);
        }

        static const unsigned int minForLength[] = {0, 0x80, 0x800, 0x10000};
        if (codePoint < minForLength[extra] || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

} // namespace GPS

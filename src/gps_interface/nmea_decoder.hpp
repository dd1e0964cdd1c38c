#pragma once

#include <string>
#include <vector>

#include "gps_fix.hpp"


namespace GPS {

class NmeaDecoder {
public:
    NmeaDecoder() = default;
    ~NmeaDecoder() = default;

    enum {
        DECODE_APPLIED       =  1,  // Fields written to the fix
        DECODE_IGNORED       =  0,  // Not a GPS talker, or a sentence type we do not decode
        DECODE_ERR_MALFORMED = -1,  // Bad structure, field count or numeric field
        DECODE_ERR_CHECKSUM  = -2   // Missing or mismatching *HH checksum
    };

    /**
     * @brief Decode one NMEA sentence and update the fix in place
     *
     * The fix is only written once the whole sentence has validated, so any
     * negative return leaves it untouched.
     *
     * @param sentence One sentence, with or without the trailing CRLF
     * @param fix Fix to update
     * @return int DECODE_* status code
     */
    int apply(const std::string& sentence, Fix& fix) const;

    /**
     * @brief XOR checksum of the bytes between '$' and '*'
     *
     * @param body Sentence body without the leading '$' and the checksum suffix
     * @return unsigned char Checksum
     */
    static unsigned char checksum(const std::string& body);

    /**
     * @brief Convert a DDMM.MMMM / DDDMM.MMMM field to decimal degrees
     *
     * @param value Raw field; empty decodes to 0.0
     * @param maxDegrees 90 for latitude, 180 for longitude
     * @param degrees Output in decimal degrees
     * @return true Field parsed
     */
    static bool parseCoordinate(const std::string& value, double maxDegrees, double& degrees);

    static constexpr const char* GPS_TALKER_PREFIX = "$GP";

protected:
    int decodeGga(const std::vector<std::string>& fields, Fix& staged) const;
    int decodeRmc(const std::vector<std::string>& fields, Fix& staged) const;

    static bool parseDecimal(const std::string& value, double& out);
    static bool parseUnsigned(const std::string& value, unsigned int& out);
    static bool parseDirection(const std::string& value, const char* allowed, std::string& out);

    static constexpr size_t GGA_FIELD_COUNT     = 15;  // Sentence id + 14 data fields
    static constexpr size_t RMC_MIN_FIELD_COUNT = 12;  // NMEA 2.x
    static constexpr size_t RMC_MAX_FIELD_COUNT = 14;  // NMEA 4.1 adds mode and nav status
    static constexpr unsigned int MAX_QUALITY   = 8;
};

} // namespace GPS

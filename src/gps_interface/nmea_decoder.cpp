#include "nmea_decoder.hpp"

#include <cctype>
#include <cstring>
#include <cmath>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "utils/logger.hpp"


namespace GPS {

unsigned char NmeaDecoder::checksum(const std::string& body) {
    unsigned char checksum = 0;
    for (char c : body) {
        checksum ^= static_cast<unsigned char>(c);
    }
    return checksum;
}


int NmeaDecoder::apply(const std::string& sentence, Fix& fix) const {
    if (sentence.empty() ||
        sentence.compare(0, std::strlen(GPS_TALKER_PREFIX), GPS_TALKER_PREFIX) != 0) {
        return DECODE_IGNORED;
    }

    Logger* logger = Logger::getLoggerInst();
    logger->log(Logger::LOG_LVL_DEBUG, "NMEA: %s\r\n", sentence.c_str());

    auto asteriskPos = sentence.find('*');
    if (asteriskPos == std::string::npos) {
        return DECODE_ERR_CHECKSUM;
    }

    std::string messageChecksum = boost::algorithm::trim_right_copy(sentence.substr(asteriskPos + 1));
    if (messageChecksum.length() != 2 ||
        !std::isxdigit(static_cast<unsigned char>(messageChecksum[0])) ||
        !std::isxdigit(static_cast<unsigned char>(messageChecksum[1]))) {
        return DECODE_ERR_CHECKSUM;
    }

    std::string body = sentence.substr(1, asteriskPos - 1);
    unsigned long expected = std::strtoul(messageChecksum.c_str(), nullptr, 16);
    if (checksum(body) != expected) {
        return DECODE_ERR_CHECKSUM;
    }

    std::vector<std::string> fields;
    boost::algorithm::split(fields, body, boost::is_any_of(","));

    // Talker prefix is already checked, the type follows the two talker letters
    const std::string sentenceType = fields[0].substr(2);

    // Decode into a copy so a bad field half way through cannot leak into the fix
    Fix staged = fix;
    int ret = DECODE_IGNORED;
    if (sentenceType == "GGA") {
        ret = decodeGga(fields, staged);
    } else if (sentenceType == "RMC") {
        ret = decodeRmc(fields, staged);
    }

    if (ret == DECODE_APPLIED) {
        fix = staged;
    }

    return ret;
}


/**
 * @brief Decode a GGA (fix data) sentence
 *
 * $GPGGA,time,lat,N,lon,E,quality,sats,hdop,alt,M,geoid,M,age,station
 */
int NmeaDecoder::decodeGga(const std::vector<std::string>& fields, Fix& staged) const {
    if (fields.size() != GGA_FIELD_COUNT) {
        return DECODE_ERR_MALFORMED;
    }

    double latitude = 0.0, longitude = 0.0;
    std::string latDir, lonDir;
    if (!parseCoordinate(fields[2], 90.0, latitude)   ||
        !parseDirection(fields[3], "NS", latDir)     ||
        !parseCoordinate(fields[4], 180.0, longitude) ||
        !parseDirection(fields[5], "EW", lonDir)) {
        return DECODE_ERR_MALFORMED;
    }

    unsigned int quality = 0, numSats = 0;
    if (!parseUnsigned(fields[6], quality) || quality > MAX_QUALITY ||
        !parseUnsigned(fields[7], numSats)) {
        return DECODE_ERR_MALFORMED;
    }

    double height = staged.height;
    if (!fields[9].empty() && !parseDecimal(fields[9], height)) {
        return DECODE_ERR_MALFORMED;
    }

    staged.latitude   = latitude;
    staged.longitude  = longitude;
    staged.latDir     = latDir;
    staged.lonDir     = lonDir;
    staged.height     = height;
    staged.numSats    = numSats;
    staged.gpsQuality = static_cast<GpsQuality>(quality);

    Logger* logger = Logger::getLoggerInst();
    logger->log(Logger::LOG_LVL_DEBUG, "GGA: %.6f %s, %.6f %s, alt %.1f m, %u sats, quality %u\r\n",
                latitude, latDir.c_str(), longitude, lonDir.c_str(), height, numSats, quality);
    return DECODE_APPLIED;
}


/**
 * @brief Decode an RMC (recommended minimum) sentence, position only
 *
 * $GPRMC,time,status,lat,N,lon,E,speed,course,date,magvar,E[,mode[,navstatus]]
 */
int NmeaDecoder::decodeRmc(const std::vector<std::string>& fields, Fix& staged) const {
    if (fields.size() < RMC_MIN_FIELD_COUNT || fields.size() > RMC_MAX_FIELD_COUNT) {
        return DECODE_ERR_MALFORMED;
    }

    double latitude = 0.0, longitude = 0.0;
    std::string latDir, lonDir;
    if (!parseCoordinate(fields[3], 90.0, latitude)   ||
        !parseDirection(fields[4], "NS", latDir)     ||
        !parseCoordinate(fields[5], 180.0, longitude) ||
        !parseDirection(fields[6], "EW", lonDir)) {
        return DECODE_ERR_MALFORMED;
    }

    staged.latitude  = latitude;
    staged.longitude = longitude;
    staged.latDir    = latDir;
    staged.lonDir    = lonDir;

    Logger* logger = Logger::getLoggerInst();
    logger->log(Logger::LOG_LVL_DEBUG, "RMC: %.6f %s, %.6f %s\r\n",
                latitude, latDir.c_str(), longitude, lonDir.c_str());
    return DECODE_APPLIED;
}


bool NmeaDecoder::parseCoordinate(const std::string& value, double maxDegrees, double& degrees) {
    if (value.empty()) {
        degrees = 0.0;
        return true;
    }

    // Minutes are always the two digits before the decimal point
    auto dotPos = value.find('.');
    if (dotPos == std::string::npos || dotPos < 3) {
        return false;
    }

    for (size_t i = 0; i < value.length(); i++) {
        if (i != dotPos && !std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }

    std::string degreeField  = value.substr(0, dotPos - 2);
    std::string minutesField = value.substr(dotPos - 2);

    double wholeDegrees = 0.0, minutes = 0.0;
    try {
        wholeDegrees = std::stod(degreeField);
        minutes      = std::stod(minutesField);
    } catch (const std::exception& e) {
        return false;
    }

    if (minutes >= 60.0) {
        return false;
    }

    double result = wholeDegrees + (minutes / 60.0);
    if (result > maxDegrees) {
        return false;
    }

    degrees = result;
    return true;
}


bool NmeaDecoder::parseDecimal(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }

    bool seenDot = false, seenDigit = false;
    for (size_t i = 0; i < value.length(); i++) {
        const char c = value[i];
        if (c == '-' && i == 0) continue;
        if (c == '.' && !seenDot) { seenDot = true; continue; }
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        seenDigit = true;
    }

    if (!seenDigit) {
        return false;
    }

    try {
        out = std::stod(value);
    } catch (const std::exception& e) {
        return false;
    }
    return std::isfinite(out);
}


bool NmeaDecoder::parseUnsigned(const std::string& value, unsigned int& out) {
    if (value.empty()) {
        out = 0;
        return true;
    }

    if (value.length() > 4) {
        return false;
    }

    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    out = static_cast<unsigned int>(std::stoul(value));
    return true;
}


bool NmeaDecoder::parseDirection(const std::string& value, const char* allowed, std::string& out) {
    if (value.empty()) {
        out.clear();
        return true;
    }

    if (value.length() != 1 || value[0] == '\0' || !std::strchr(allowed, value[0])) {
        return false;
    }

    out = value;
    return true;
}

} // namespace GPS

#ifndef GPS_FIX_HPP
#define GPS_FIX_HPP

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>


namespace GPS {

/**
 * @brief GGA fix quality indicator
 *
 * Receivers may report other NMEA codes (3..8); those are stored with their raw value.
 */
enum class GpsQuality : uint8_t {
    Invalid = 0,
    GpsFix  = 1,
    DgpsFix = 2
};

/**
 * @brief Latest decoded position and receiver status
 *
 * Latitude and longitude hold magnitudes only; the hemisphere lives in latDir/lonDir.
 */
struct Fix {
    double latitude  = 0.0;
    double longitude = 0.0;
    std::string latDir;
    std::string lonDir;
    double height = 0.0;
    unsigned int numSats = 0;
    GpsQuality gpsQuality = GpsQuality::Invalid;

    /**
     * @brief Check if position data is available
     *
     * NOTE: a genuine fix at exactly (0, 0) is reported as "no position". Known
     * limitation, kept so callers see the same behavior as the receiver tools.
     *
     * @return true Latitude or longitude is non-zero
     */
    bool hasPosition() const {
        return latitude != 0.0 || longitude != 0.0;
    }

    /**
     * @brief Check if the receiver reports a usable fix
     *
     * @return true Quality above Invalid and at least one satellite
     */
    bool isValid() const {
        return static_cast<uint8_t>(gpsQuality) > 0 && numSats > 0;
    }

    const char* qualityName() const {
        switch (gpsQuality) {
            case GpsQuality::Invalid: return "Invalid";
            case GpsQuality::GpsFix:  return "GPS";
            case GpsQuality::DgpsFix: return "DGPS";
            default:                  return "Unknown";
        }
    }

    bool operator==(const Fix& other) const {
        return latitude   == other.latitude  &&
               longitude  == other.longitude &&
               latDir     == other.latDir    &&
               lonDir     == other.lonDir    &&
               height     == other.height    &&
               numSats    == other.numSats   &&
               gpsQuality == other.gpsQuality;
    }
};


inline nlohmann::json toJson(const Fix& fix) {
    nlohmann::json fixJson;
    fixJson["latitude"   ] = fix.latitude;
    fixJson["longitude"  ] = fix.longitude;
    fixJson["lat_dir"    ] = fix.latDir;
    fixJson["lon_dir"    ] = fix.lonDir;
    fixJson["height"     ] = fix.height;
    fixJson["num_sats"   ] = fix.numSats;
    fixJson["gps_quality"] = static_cast<int>(fix.gpsQuality);
    return fixJson;
}

} // namespace GPS

#endif

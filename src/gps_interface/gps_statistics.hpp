#ifndef GPS_STATISTICS_HPP
#define GPS_STATISTICS_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "lib/SampleWindow.hpp"
#include "gps_fix.hpp"


namespace GPS {

/**
 * @brief Rolling window of fix snapshots with per field aggregates
 *
 * Aggregates cover latitude, longitude and height and are recomputed from the
 * window on every call.
 */
class GpsStatistics {
public:
    struct FieldStats {
        std::optional<double> latitude;
        std::optional<double> longitude;
        std::optional<double> height;
    };

    explicit GpsStatistics(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Append a snapshot, dropping the oldest one when full
     *
     * @param fix Snapshot to add
     */
    void push(const Fix& fix);

    FieldStats mean() const;
    FieldStats median() const;

    /**
     * @brief Most frequent value per field
     *
     * A field has no mode when every value is unique or when several values
     * tie for the highest count.
     */
    FieldStats mode() const;

    size_t size() const { return m_Window.size(); }
    size_t capacity() const { return m_Window.capacity(); }
    bool empty() const { return m_Window.empty(); }
    void clear() { m_Window.clear(); }

    static constexpr size_t DEFAULT_CAPACITY = 10;

private:
    template <typename Aggregate>
    FieldStats aggregate(Aggregate fn) const;

    static std::optional<double> meanOf(std::vector<double> values);
    static std::optional<double> medianOf(std::vector<double> values);
    static std::optional<double> modeOf(std::vector<double> values);

    Lib::SampleWindow<Fix> m_Window;
};

} // namespace GPS

#endif

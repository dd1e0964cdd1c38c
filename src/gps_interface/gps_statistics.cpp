#include "gps_statistics.hpp"

#include <algorithm>
#include <map>
#include <numeric>


namespace GPS {

GpsStatistics::GpsStatistics(size_t capacity) : m_Window(capacity) {
}


void GpsStatistics::push(const Fix& fix) {
    m_Window.push(fix);
}


template <typename Aggregate>
GpsStatistics::FieldStats GpsStatistics::aggregate(Aggregate fn) const {
    FieldStats result;
    if (m_Window.empty()) {
        return result;
    }

    std::vector<double> latitudes, longitudes, heights;
    latitudes.reserve(m_Window.size());
    longitudes.reserve(m_Window.size());
    heights.reserve(m_Window.size());
    for (size_t i = 0; i < m_Window.size(); i++) {
        const Fix& fix = m_Window[i];
        latitudes.push_back(fix.latitude);
        longitudes.push_back(fix.longitude);
        heights.push_back(fix.height);
    }

    result.latitude  = fn(std::move(latitudes));
    result.longitude = fn(std::move(longitudes));
    result.height    = fn(std::move(heights));
    return result;
}


GpsStatistics::FieldStats GpsStatistics::mean() const {
    return aggregate(&GpsStatistics::meanOf);
}


GpsStatistics::FieldStats GpsStatistics::median() const {
    return aggregate(&GpsStatistics::medianOf);
}


GpsStatistics::FieldStats GpsStatistics::mode() const {
    return aggregate(&GpsStatistics::modeOf);
}


std::optional<double> GpsStatistics::meanOf(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}


std::optional<double> GpsStatistics::medianOf(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }

    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}


std::optional<double> GpsStatistics::modeOf(std::vector<double> values) {
    std::map<double, size_t> counts;
    for (double v : values) {
        counts[v]++;
    }

    std::optional<double> best;
    size_t bestCount = 1;
    bool tied = false;
    for (const auto& [value, count] : counts) {
        if (count > bestCount) {
            best = value;
            bestCount = count;
            tied = false;
        } else if (count == bestCount && best.has_value()) {
            tied = true;
        }
    }

    if (tied) {
        return std::nullopt;
    }
    return best;
}

} // namespace GPS

#pragma once

#include <stdexcept>
#include <string>


namespace GPS {

/**
 * @brief Raised when the serial device cannot be opened or configured
 */
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace GPS

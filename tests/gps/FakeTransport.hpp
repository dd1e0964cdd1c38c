#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/system/error_code.hpp>

#include "Devices/Transport.hpp"


namespace Test {

/**
 * @brief In-memory transport serving queued lines
 *
 * The state is shared so a test can keep feeding and inspecting it after the
 * transport has been handed over to a session.
 */
class FakeTransport : public Device::Transport {
public:
    struct State {
        std::deque<std::string> lines;
        bool open = true;
        bool failRead = false;
        bool failBytesWaiting = false;
        int readCalls = 0;
        int closeCalls = 0;
        std::function<void(State&)> onRead;  // Runs after every successful read
    };

    explicit FakeTransport(std::shared_ptr<State> state = std::make_shared<State>())
        : m_State(std::move(state)) {}

    int readLine(std::string& line, boost::system::error_code& ec) override {
        m_State->readCalls++;
        if (m_State->failRead) {
            ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
            return -1;
        }

        line.clear();
        if (m_State->lines.empty()) {
            return 0;
        }

        line = m_State->lines.front();
        m_State->lines.pop_front();
        if (m_State->onRead) {
            m_State->onRead(*m_State);
        }
        return static_cast<int>(line.size());
    }

    int bytesWaiting(boost::system::error_code& ec) override {
        if (m_State->failBytesWaiting) {
            ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
            return -1;
        }

        size_t total = 0;
        for (const std::string& line : m_State->lines) {
            total += line.size();
        }
        return static_cast<int>(total);
    }

    bool isOpen() const override { return m_State->open; }

    void close() override {
        m_State->open = false;
        m_State->closeCalls++;
    }

    const std::shared_ptr<State>& state() const { return m_State; }

private:
    std::shared_ptr<State> m_State;
};


// Reference sentences, checksums included
constexpr const char* GGA_MUNICH  = "$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,47.0,M,,*4F";
constexpr const char* GGA_SECOND  = "$GPGGA,123520,4907.038,N,01231.000,E,1,10,0.8,600.0,M,47.0,M,,*49";
constexpr const char* GGA_NO_FIX  = "$GPGGA,123519,,,,,0,00,,,M,,M,,*6B";
constexpr const char* RMC_MUNICH  = "$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A";

} // namespace Test

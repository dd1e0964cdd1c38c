#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <pty.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "Devices/SerialPort.hpp"
#include "FakeTransport.hpp"
#include "gps_interface/gps_errors.hpp"
#include "gps_interface/gps_session.hpp"

using Device::SerialPort;
using GPS::GpsSession;


/**
 * @brief Runs SerialPort against a pseudo terminal
 *
 * The test writes to the master end, the port reads the slave end like a
 * real receiver's tty.
 */
class SerialPortTest : public ::testing::Test {
protected:
    static constexpr int TIMEOUT_MS = 200;

    void SetUp() override {
        char name[128] = {0};
        int slave = -1;
        ASSERT_EQ(::openpty(&m_Master, &slave, name, nullptr, nullptr), 0);

        port = std::make_unique<SerialPort>(name, 9600, TIMEOUT_MS);
        // The port holds its own descriptor for the slave
        ::close(slave);
    }

    void TearDown() override {
        port.reset();
        closeMaster();
    }

    void send(const std::string& data) {
        ASSERT_EQ(::write(m_Master, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void closeMaster() {
        if (m_Master >= 0) {
            ::close(m_Master);
            m_Master = -1;
        }
    }

    // Bytes written to the master reach the slave asynchronously
    bool waitForBytes(Device::Transport& transport, int expected) {
        for (int i = 0; i < 100; i++) {
            boost::system::error_code ec;
            if (transport.bytesWaiting(ec) >= expected) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    std::unique_ptr<SerialPort> port;

private:
    int m_Master = -1;
};


TEST_F(SerialPortTest, MissingDeviceThrowsConnectionError) {
    EXPECT_THROW(SerialPort("/dev/does-not-exist-gps", 9600, TIMEOUT_MS), GPS::ConnectionError);
}


TEST_F(SerialPortTest, UnsupportedBaudThrowsConnectionError) {
    EXPECT_THROW(SerialPort("/dev/null", 12345, TIMEOUT_MS), GPS::ConnectionError);
}


TEST_F(SerialPortTest, CompleteLineIsReturnedWithTerminator) {
    const std::string sentence = std::string(::Test::GGA_MUNICH) + "\r\n";
    send(sentence);
    ASSERT_TRUE(waitForBytes(*port, static_cast<int>(sentence.size())));

    std::string line;
    boost::system::error_code ec;
    EXPECT_EQ(port->readLine(line, ec), static_cast<int>(sentence.size()));
    EXPECT_FALSE(ec);
    EXPECT_EQ(line, sentence);
}


TEST_F(SerialPortTest, PartialLineIsReturnedAfterTimeout) {
    const std::string partial = "$GPGGA,123520,49";
    send(partial);
    ASSERT_TRUE(waitForBytes(*port, static_cast<int>(partial.size())));

    std::string line;
    boost::system::error_code ec;
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(port->readLine(line, ec), static_cast<int>(partial.size()));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin).count();

    EXPECT_FALSE(ec);
    EXPECT_EQ(line, partial);
    EXPECT_GE(elapsed, TIMEOUT_MS - 50);
}


TEST_F(SerialPortTest, NothingArrivingGivesEmptyLine) {
    std::string line = "stale";
    boost::system::error_code ec;
    EXPECT_EQ(port->readLine(line, ec), 0);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(line.empty());
}


TEST_F(SerialPortTest, BufferedTailCountsAsWaiting) {
    send("LINE1\r\nPART");
    ASSERT_TRUE(waitForBytes(*port, 11));

    std::string line;
    boost::system::error_code ec;
    EXPECT_EQ(port->readLine(line, ec), 7);
    EXPECT_EQ(line, "LINE1\r\n");

    // The tail was pulled off the tty with the first line and sits in the port
    EXPECT_EQ(port->bytesWaiting(ec), 4);
    EXPECT_FALSE(ec);
}


TEST_F(SerialPortTest, ClosedPortRefusesIo) {
    port->close();
    EXPECT_FALSE(port->isOpen());

    std::string line;
    boost::system::error_code ec;
    EXPECT_EQ(port->readLine(line, ec), -1);
    EXPECT_TRUE(ec);

    ec.clear();
    EXPECT_EQ(port->bytesWaiting(ec), -1);
    EXPECT_TRUE(ec);
}


TEST_F(SerialPortTest, SessionReportsLostLinkWhenDeviceHangsUp) {
    SerialPort* raw = port.get();
    GpsSession session(std::move(port));

    const std::string burst = std::string(::Test::GGA_MUNICH) + "\r\n$GPGGA,123520,49";
    send(burst);
    ASSERT_TRUE(waitForBytes(*raw, static_cast<int>(burst.size())));

    boost::system::error_code ec;
    EXPECT_EQ(session.drainAvailable(ec), GpsSession::SESSION_OK);
    EXPECT_FALSE(ec);
    EXPECT_EQ(session.stats().applied, 1u);
    EXPECT_EQ(session.stats().rejected, 1u);
    EXPECT_TRUE(session.fix().hasPosition());

    closeMaster();

    EXPECT_EQ(session.drainAvailable(ec), GpsSession::SESSION_ERR_READ_FAILED);
    EXPECT_TRUE(ec);
}

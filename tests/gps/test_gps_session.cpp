#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "FakeTransport.hpp"
#include "gps_interface/gps_session.hpp"

using GPS::GpsSession;
using Test::FakeTransport;


class GpsSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_shared<FakeTransport::State>();
        session = std::make_unique<GpsSession>(std::make_unique<FakeTransport>(state));
    }

    std::shared_ptr<FakeTransport::State> state;
    std::unique_ptr<GpsSession> session;
};


TEST_F(GpsSessionTest, NullTransportIsRejected) {
    EXPECT_THROW(std::make_unique<GpsSession>(nullptr), std::invalid_argument);
}


TEST_F(GpsSessionTest, NothingWaitingLeavesDefaults) {
    boost::system::error_code ec;
    EXPECT_EQ(session->drainAvailable(ec), GpsSession::SESSION_OK);
    EXPECT_FALSE(ec);
    EXPECT_EQ(session->fix(), GPS::Fix());
    EXPECT_EQ(state->readCalls, 0);
}


TEST_F(GpsSessionTest, DrainsEveryQueuedLine) {
    state->lines.push_back(std::string(::Test::GGA_MUNICH) + "\r\n");
    state->lines.push_back(std::string(::Test::GGA_SECOND) + "\r\n");

    boost::system::error_code ec;
    ASSERT_EQ(session->drainAvailable(ec), GpsSession::SESSION_OK);

    EXPECT_TRUE(state->lines.empty());
    EXPECT_EQ(session->stats().applied, 2u);
    EXPECT_NEAR(session->fix().latitude, 49.1173, 1e-4);
    EXPECT_EQ(session->fix().numSats, 10u);
}


TEST_F(GpsSessionTest, BadLinesAreCountedAndSkipped) {
    state->lines.push_back("$GPGGA,garbage*00\r\n");
    state->lines.push_back("$GNGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,47.0,M,,*51\r\n");
    state->lines.push_back("\xff\xfe\x80\r\n");
    state->lines.push_back("\r\n");
    state->lines.push_back(std::string(::Test::RMC_MUNICH) + "\r\n");

    boost::system::error_code ec;
    ASSERT_EQ(session->drainAvailable(ec), GpsSession::SESSION_OK);

    const GpsSession::Stats& stats = session->stats();
    EXPECT_EQ(stats.applied, 1u);
    EXPECT_EQ(stats.ignored, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.badEncoding, 1u);
    EXPECT_TRUE(session->fix().hasPosition());
}


TEST_F(GpsSessionTest, ReadFailureIsReported) {
    state->lines.push_back(std::string(::Test::GGA_MUNICH) + "\r\n");
    state->failRead = true;

    boost::system::error_code ec;
    EXPECT_EQ(session->drainAvailable(ec), GpsSession::SESSION_ERR_READ_FAILED);
    EXPECT_TRUE(ec);
    EXPECT_EQ(session->fix(), GPS::Fix());
}


TEST_F(GpsSessionTest, BytesWaitingFailureIsReported) {
    state->failBytesWaiting = true;

    boost::system::error_code ec;
    EXPECT_EQ(session->drainAvailable(ec), GpsSession::SESSION_ERR_READ_FAILED);
    EXPECT_TRUE(ec);
}


TEST_F(GpsSessionTest, StreamingReceiverCannotHoldTheDrain) {
    const std::string line = std::string(::Test::GGA_MUNICH) + "\r\n";
    state->lines.push_back(line);
    state->lines.push_back(line);
    state->lines.push_back(line);
    state->onRead = [line](FakeTransport::State& s) { s.lines.push_back(line); };

    boost::system::error_code ec;
    ASSERT_EQ(session->drainAvailable(ec), GpsSession::SESSION_OK);

    // Only what was waiting at entry is consumed
    EXPECT_EQ(state->readCalls, 3);
    EXPECT_EQ(state->lines.size(), 3u);
}


TEST_F(GpsSessionTest, SnapshotIsACopy) {
    state->lines.push_back(std::string(::Test::GGA_MUNICH) + "\r\n");
    boost::system::error_code ec;
    ASSERT_EQ(session->drainAvailable(ec), GpsSession::SESSION_OK);

    GPS::Fix copy = session->snapshot();
    copy.latitude = 0.0;
    EXPECT_NEAR(session->fix().latitude, 48.1173, 1e-4);
}


TEST_F(GpsSessionTest, CloseClosesTransportOnce) {
    EXPECT_TRUE(session->isOpen());
    session->close();
    EXPECT_FALSE(session->isOpen());
    session.reset();
    EXPECT_EQ(state->closeCalls, 1);
}


TEST(GpsSessionUtf8, Validation) {
    EXPECT_TRUE(GpsSession::isValidUtf8("$GPGGA,plain ascii"));
    EXPECT_TRUE(GpsSession::isValidUtf8("\xc2\xb0"));
    EXPECT_TRUE(GpsSession::isValidUtf8("\xe2\x82\xac"));
    EXPECT_FALSE(GpsSession::isValidUtf8("\xff"));
    EXPECT_FALSE(GpsSession::isValidUtf8("\xc2"));
    EXPECT_FALSE(GpsSession::isValidUtf8("\xc0\xaf"));
    EXPECT_FALSE(GpsSession::isValidUtf8("\xed\xa0\x80"));
}

#include <chrono>
#include <memory>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "lib/UpdateScheduler.hpp"

using Lib::UpdateScheduler;
using namespace std::chrono_literals;


class UpdateSchedulerTest : public ::testing::Test {
protected:
    std::unique_ptr<UpdateScheduler> make(int updateMs, int reconnectMs) {
        return std::make_unique<UpdateScheduler>(io_context, updateMs, reconnectMs,
            [this]() {
                ticks++;
                if (onTick) {
                    onTick();
                }
            },
            [this]() { reconnects++; });
    }

    boost::asio::io_context io_context;
    int ticks = 0;
    int reconnects = 0;
    std::function<void()> onTick;
};


TEST_F(UpdateSchedulerTest, RejectsNonPositiveIntervals) {
    EXPECT_THROW(make(0, 100), std::invalid_argument);
    EXPECT_THROW(make(100, -1), std::invalid_argument);
}


TEST_F(UpdateSchedulerTest, NothingFiresBeforeStart) {
    auto scheduler = make(5, 5);
    io_context.run_for(50ms);
    EXPECT_FALSE(scheduler->isRunning());
    EXPECT_EQ(ticks, 0);
}


TEST_F(UpdateSchedulerTest, TicksRepeatUntilStopped) {
    auto scheduler = make(5, 1000);
    onTick = [&]() {
        if (ticks == 3) {
            scheduler->stop();
        }
    };

    scheduler->start();
    EXPECT_TRUE(scheduler->isRunning());
    io_context.run_for(2s);

    EXPECT_EQ(ticks, 3);
    EXPECT_FALSE(scheduler->isRunning());
}


TEST_F(UpdateSchedulerTest, StartTwiceDoesNotDoubleTicks) {
    auto scheduler = make(20, 1000);
    scheduler->start();
    scheduler->start();
    onTick = [&]() { scheduler->stop(); };

    io_context.run_for(500ms);
    EXPECT_EQ(ticks, 1);
}


TEST_F(UpdateSchedulerTest, IntervalChangeKeepsRunning) {
    auto scheduler = make(1000, 1000);
    scheduler->start();

    EXPECT_EQ(scheduler->setUpdateInterval(5), 0);
    EXPECT_TRUE(scheduler->isRunning());
    EXPECT_EQ(scheduler->updateInterval(), 5);

    onTick = [&]() {
        if (ticks == 2) {
            scheduler->stop();
        }
    };
    io_context.run_for(500ms);
    EXPECT_EQ(ticks, 2);
}


TEST_F(UpdateSchedulerTest, InvalidIntervalIsRejected) {
    auto scheduler = make(100, 200);
    EXPECT_EQ(scheduler->setUpdateInterval(0), -1);
    EXPECT_EQ(scheduler->setReconnectInterval(-5), -1);
    EXPECT_EQ(scheduler->updateInterval(), 100);
    EXPECT_EQ(scheduler->reconnectInterval(), 200);

    EXPECT_EQ(scheduler->setReconnectInterval(50), 0);
    EXPECT_EQ(scheduler->reconnectInterval(), 50);
}


TEST_F(UpdateSchedulerTest, ReconnectDoesNotStack) {
    auto scheduler = make(1000, 10);

    EXPECT_TRUE(scheduler->scheduleReconnect());
    EXPECT_FALSE(scheduler->scheduleReconnect());
    EXPECT_FALSE(scheduler->scheduleReconnect());
    EXPECT_TRUE(scheduler->isReconnectPending());

    io_context.run_for(500ms);
    EXPECT_EQ(reconnects, 1);
    EXPECT_FALSE(scheduler->isReconnectPending());

    // One shot: a new attempt can be armed once the previous one fired
    EXPECT_TRUE(scheduler->scheduleReconnect());
}


TEST_F(UpdateSchedulerTest, CancelledReconnectNeverFires) {
    auto scheduler = make(1000, 10);
    ASSERT_TRUE(scheduler->scheduleReconnect());
    scheduler->cancelReconnect();
    EXPECT_FALSE(scheduler->isReconnectPending());

    io_context.run_for(100ms);
    EXPECT_EQ(reconnects, 0);
}


TEST_F(UpdateSchedulerTest, StopLeavesPendingReconnect) {
    auto scheduler = make(1000, 10);
    scheduler->start();
    ASSERT_TRUE(scheduler->scheduleReconnect());
    scheduler->stop();

    io_context.run_for(500ms);
    EXPECT_EQ(reconnects, 1);
    EXPECT_EQ(ticks, 0);
}


TEST_F(UpdateSchedulerTest, DestroyedSchedulerFiresNothing) {
    {
        auto scheduler = make(5, 5);
        scheduler->start();
        ASSERT_TRUE(scheduler->scheduleReconnect());
    }

    io_context.run_for(100ms);
    EXPECT_EQ(ticks, 0);
    EXPECT_EQ(reconnects, 0);
}


TEST_F(UpdateSchedulerTest, ReconnectIntervalChangedFromTickIsUsedNext) {
    auto scheduler = make(5, 5000);
    scheduler->start();

    // Settings arrive on the io_context thread, like every other caller
    onTick = [&]() {
        scheduler->stop();
        EXPECT_EQ(scheduler->setReconnectInterval(10), 0);
        EXPECT_TRUE(scheduler->scheduleReconnect());
    };
    io_context.run_for(500ms);

    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(reconnects, 1);
    EXPECT_EQ(scheduler->reconnectInterval(), 10);
}

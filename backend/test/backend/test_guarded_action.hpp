#pragma once

#include "event_recorder.hpp"

#include <backend/actions/guarded_action.hpp>
#include <backend/actions/single_flight_guard.hpp>
#include <storage/storage_error.hpp>
#include <utility/awaiter.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;

namespace Test
{
    class SingleFlightGuardTests : public ::testing::Test
    {
      protected:
        SingleFlightGuard guard_{};
    };

    TEST_F(SingleFlightGuardTests, SecondAcquireIsRejectedWhileBusy)
    {
        auto ticket = guard_.tryAcquire();
        ASSERT_TRUE(ticket.has_value());
        EXPECT_TRUE(guard_.busy());
        EXPECT_FALSE(guard_.tryAcquire().has_value());
    }

    TEST_F(SingleFlightGuardTests, DestroyingTheTicketReleases)
    {
        {
            auto ticket = guard_.tryAcquire();
            ASSERT_TRUE(ticket.has_value());
        }
        EXPECT_FALSE(guard_.busy());
        EXPECT_TRUE(guard_.tryAcquire().has_value());
    }

    TEST_F(SingleFlightGuardTests, MovedTicketReleasesOnlyOnce)
    {
        auto ticket = guard_.tryAcquire();
        ASSERT_TRUE(ticket.has_value());
        auto moved = std::move(*ticket);
        ticket.reset();
        EXPECT_TRUE(guard_.busy());

        moved.release();
        EXPECT_FALSE(guard_.busy());

        auto next = guard_.tryAcquire();
        ASSERT_TRUE(next.has_value());
        moved.release();
        EXPECT_TRUE(guard_.busy());
    }

    class GuardedActionTests : public ::testing::Test
    {
      protected:
        std::shared_ptr<EventHub> hub_ = std::make_shared<EventHub>();
        EventRecorder recorder_{*hub_};
    };

    TEST_F(GuardedActionTests, SubmitWhileBusyIsRejectedWithoutSecondRun)
    {
        GuardedAction action{"Test", hub_};
        std::promise<void> gate;
        auto gateFuture = gate.get_future().share();
        Awaiter started{};
        std::atomic_int runs{0};

        EXPECT_TRUE(action.submit([&]() {
            ++runs;
            started.arrive();
            gateFuture.wait();
        }));
        ASSERT_TRUE(started.waitFor(2s));

        EXPECT_FALSE(action.submit([&]() {
            ++runs;
        }));
        EXPECT_TRUE(action.busy());

        gate.set_value();
        action.wait();

        EXPECT_EQ(runs.load(), 1);
        EXPECT_FALSE(action.busy());
        EXPECT_TRUE(recorder_.hasMessage("A background task is still running, please retry later."));
    }

    TEST_F(GuardedActionTests, RejectionCallbackReplacesTheBusyMessage)
    {
        GuardedAction action{"Test", hub_};
        std::promise<void> gate;
        auto gateFuture = gate.get_future().share();
        Awaiter started{};
        bool rejected = false;

        action.submit([&]() {
            started.arrive();
            gateFuture.wait();
        });
        ASSERT_TRUE(started.waitFor(2s));
        action.submit(
            []() {},
            [&rejected]() {
                rejected = true;
            });
        gate.set_value();
        action.wait();

        EXPECT_TRUE(rejected);
        EXPECT_TRUE(recorder_.messages().empty());
    }

    TEST_F(GuardedActionTests, GuardIsReleasedAfterUnexpectedFailure)
    {
        GuardedAction action{"Test", hub_};
        action.submit([]() {
            throw std::runtime_error{"boom"};
        });
        action.wait();

        EXPECT_FALSE(action.busy());
        EXPECT_TRUE(recorder_.hasMessage("An unexpected error occurred, please retry later."));

        bool ran = false;
        EXPECT_TRUE(action.submit([&ran]() {
            ran = true;
        }));
        action.wait();
        EXPECT_TRUE(ran);
    }

    TEST_F(GuardedActionTests, TimeoutIsReportedWithItsOwnMessage)
    {
        GuardedAction action{
            "Test",
            hub_,
            ActionMessages{
                .timeout = "Too slow.",
                .timeoutDuration = 1234ms,
            }};
        action.submit([]() {
            throw Storage::TimeoutError{"no answer"};
        });
        action.wait();

        const auto messages = recorder_.all<SharedData::StatusMessage>();
        ASSERT_EQ(messages.size(), 1);
        EXPECT_EQ(messages.front().text, "Too slow.");
        EXPECT_EQ(messages.front().duration, 1234ms);
        EXPECT_FALSE(action.busy());
    }

    TEST_F(GuardedActionTests, GuardIsReleasedAfterFailureOfUnknownType)
    {
        GuardedAction action{"Test", hub_};
        action.submit([]() {
            throw 42;
        });
        action.wait();
        EXPECT_FALSE(action.busy());
        EXPECT_TRUE(recorder_.hasMessage("An unexpected error occurred, please retry later."));
    }

    TEST_F(GuardedActionTests, SequentialSubmitsAllRun)
    {
        GuardedAction action{"Test", hub_};
        int runs = 0;
        for (int i = 0; i != 5; ++i)
        {
            EXPECT_TRUE(action.submit([&runs]() {
                ++runs;
            }));
            action.wait();
        }
        EXPECT_EQ(runs, 5);
    }
}

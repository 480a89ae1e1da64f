#pragma once

#include "event_recorder.hpp"

#include <backend/event_hub.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono_literals;

namespace Test
{
    class EventHubTests : public ::testing::Test
    {
      protected:
        EventHub hub_{};
    };

    TEST_F(EventHubTests, PublishReachesAllSubscribers)
    {
        int first = 0;
        int second = 0;
        hub_.subscribe([&first](auto const&) {
            ++first;
        });
        hub_.subscribe([&second](auto const&) {
            ++second;
        });

        hub_.publish(SharedData::LoggedOut{});
        hub_.publish(SharedData::RecycleBinChanged{});

        EXPECT_EQ(first, 2);
        EXPECT_EQ(second, 2);
    }

    TEST_F(EventHubTests, TypedSubscriptionOnlySeesItsType)
    {
        std::vector<std::string> urls;
        hub_.on<SharedData::ShareLookupStarted>([&urls](SharedData::ShareLookupStarted const& event) {
            urls.push_back(event.url);
        });

        hub_.publish(SharedData::LoggedOut{});
        hub_.publish(SharedData::ShareLookupStarted{.url = "https://example.com/i1"});

        ASSERT_EQ(urls.size(), 1);
        EXPECT_EQ(urls.front(), "https://example.com/i1");
    }

    TEST_F(EventHubTests, UnsubscribedHandlerIsNotCalled)
    {
        int calls = 0;
        const auto id = hub_.subscribe([&calls](auto const&) {
            ++calls;
        });
        EXPECT_TRUE(hub_.unsubscribe(id));
        EXPECT_FALSE(hub_.unsubscribe(id));

        hub_.publish(SharedData::LoggedOut{});
        EXPECT_EQ(calls, 0);
        EXPECT_EQ(hub_.subscriberCount(), 0);
    }

    TEST_F(EventHubTests, ThrowingHandlerDoesNotStopOthers)
    {
        int calls = 0;
        hub_.subscribe([](auto const&) {
            throw std::runtime_error{"handler failed"};
        });
        hub_.subscribe([&calls](auto const&) {
            ++calls;
        });

        EXPECT_NO_THROW(hub_.publish(SharedData::LoggedOut{}));
        EXPECT_EQ(calls, 1);
    }

    TEST_F(EventHubTests, HandlerThrowingANonExceptionDoesNotStopOthers)
    {
        int calls = 0;
        hub_.subscribe([](auto const&) {
            throw 42;
        });
        hub_.subscribe([&calls](auto const&) {
            ++calls;
        });

        EXPECT_NO_THROW(hub_.publish(SharedData::LoggedOut{}));
        EXPECT_NO_THROW(hub_.message("still delivered", 1s));
        EXPECT_EQ(calls, 2);
    }

    TEST_F(EventHubTests, HandlerMayUnsubscribeItself)
    {
        int calls = 0;
        EventHub::SubscriptionId id = 0;
        id = hub_.subscribe([this, &calls, &id](auto const&) {
            ++calls;
            hub_.unsubscribe(id);
        });

        hub_.publish(SharedData::LoggedOut{});
        hub_.publish(SharedData::LoggedOut{});
        EXPECT_EQ(calls, 1);
    }

    TEST_F(EventHubTests, MessageIsPublishedAsStatusMessage)
    {
        EventRecorder recorder{hub_};
        hub_.message("hello", 3000ms, SharedData::MessageLevel::Warning);

        const auto messages = recorder.all<SharedData::StatusMessage>();
        ASSERT_EQ(messages.size(), 1);
        EXPECT_EQ(messages.front().text, "hello");
        EXPECT_EQ(messages.front().duration, 3000ms);
        EXPECT_EQ(messages.front().level, SharedData::MessageLevel::Warning);
    }
}

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>

/**
 * @brief Lets a test wait until background threads reached a point a given number of times.
 */
class Awaiter
{
  public:
    Awaiter(int maxCount = 1)
        : maxCount_(maxCount)
        , future_{promise_.get_future()}
    {}

    bool waitFor(std::chrono::milliseconds const& duration = std::chrono::seconds{1})
    {
        return future_.wait_for(duration) == std::future_status::ready;
    }

    void wait()
    {
        future_.wait();
    }

    void arrive()
    {
        std::scoped_lock lock{guard_};
        ++counter_;
        if (counter_ == maxCount_)
            promise_.set_value();
    }

    int count() const
    {
        std::scoped_lock lock{guard_};
        return counter_;
    }

  private:
    mutable std::mutex guard_{};
    const int maxCount_{0};
    int counter_ = 0;
    std::promise<void> promise_{};
    std::shared_future<void> future_;
};

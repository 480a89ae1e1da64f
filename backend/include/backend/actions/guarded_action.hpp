#pragma once

#include <backend/actions/single_flight_guard.hpp>
#include <backend/event_hub.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief The texts a guarded action reports when it cannot do its work.
 */
struct ActionMessages
{
    std::string busy{"A background task is still running, please retry later."};
    std::chrono::milliseconds busyDuration{3100};
    std::string timeout{"Network timeout, please retry later."};
    std::chrono::milliseconds timeoutDuration{6000};
    std::string failure{"An unexpected error occurred, please retry later."};
    std::chrono::milliseconds failureDuration{6000};
};

/**
 * @brief Runs at most one body at a time on a background thread.
 *
 * A submit while a body runs is rejected, never queued. Timeouts and unexpected failures thrown by the body are
 * logged and reported as status messages. The guard is released after every run, however the body exits.
 */
class GuardedAction
{
  public:
    GuardedAction(std::string name, std::shared_ptr<EventHub> hub, ActionMessages messages = {});
    ~GuardedAction();
    GuardedAction(GuardedAction const&) = delete;
    GuardedAction& operator=(GuardedAction const&) = delete;
    GuardedAction(GuardedAction&&) = delete;
    GuardedAction& operator=(GuardedAction&&) = delete;

    /**
     * @brief Starts the body in the background if no other body of this action runs.
     *
     * @param body The work to do.
     * @param onRejected Called instead of publishing the busy message when rejected.
     * @return true if the body was started.
     */
    bool submit(std::function<void()> body, std::function<void()> onRejected = {});

    bool busy() const;

    /**
     * @brief Blocks until the last started body finished.
     */
    void wait();

    std::string const& name() const;

  private:
    void run(SingleFlightGuard::Ticket ticket, std::function<void()> const& body);

  private:
    std::string name_;
    std::shared_ptr<EventHub> hub_;
    ActionMessages messages_;
    SingleFlightGuard guard_;
    std::mutex threadGuard_;
    std::thread thread_;
};

#include <backend/actions/guarded_action.hpp>
#include <log/log.hpp>
#include <storage/storage_error.hpp>

GuardedAction::GuardedAction(std::string name, std::shared_ptr<EventHub> hub, ActionMessages messages)
    : name_{std::move(name)}
    , hub_{std::move(hub)}
    , messages_{std::move(messages)}
    , guard_{}
    , threadGuard_{}
    , thread_{}
{}

GuardedAction::~GuardedAction()
{
    wait();
}

bool GuardedAction::submit(std::function<void()> body, std::function<void()> onRejected)
{
    auto ticket = guard_.tryAcquire();
    if (!ticket)
    {
        Log::debug("{}: Rejected, still running.", name_);
        if (onRejected)
            onRejected();
        else
            hub_->message(messages_.busy, messages_.busyDuration, SharedData::MessageLevel::Warning);
        return false;
    }

    std::scoped_lock lock{threadGuard_};
    // The previous run released its ticket, its thread is about to end.
    if (thread_.joinable())
        thread_.join();

    thread_ = std::thread{[this, ticket = std::move(*ticket), body = std::move(body)]() mutable {
        run(std::move(ticket), body);
    }};
    return true;
}

void GuardedAction::run(SingleFlightGuard::Ticket ticket, std::function<void()> const& body)
{
    Log::debug("{}: Started.", name_);
    try
    {
        body();
    }
    catch (Storage::TimeoutError const& e)
    {
        Log::warn("{}: Network timeout: {}", name_, e.what());
        hub_->message(messages_.timeout, messages_.timeoutDuration, SharedData::MessageLevel::Error);
    }
    catch (std::exception const& e)
    {
        Log::error("{}: Unexpected failure: {}", name_, e.what());
        hub_->message(messages_.failure, messages_.failureDuration, SharedData::MessageLevel::Error);
    }
    catch (...)
    {
        Log::error("{}: Unexpected failure of unknown type.", name_);
        hub_->message(messages_.failure, messages_.failureDuration, SharedData::MessageLevel::Error);
    }
    ticket.release();
    Log::debug("{}: Finished.", name_);
}

bool GuardedAction::busy() const
{
    return guard_.busy();
}

void GuardedAction::wait()
{
    std::scoped_lock lock{threadGuard_};
    if (thread_.joinable())
        thread_.join();
}

std::string const& GuardedAction::name() const
{
    return name_;
}

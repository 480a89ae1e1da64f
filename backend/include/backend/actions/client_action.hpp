#pragma once

#include <backend/actions/guarded_action.hpp>
#include <backend/event_hub.hpp>
#include <storage/storage_client.hpp>

#include <chrono>
#include <memory>
#include <string>

/**
 * @brief Common base of the actions that wrap calls of the storage client. All entry points of one action share
 * one guard.
 */
class ClientAction
{
  public:
    ClientAction(
        std::string name,
        std::shared_ptr<Storage::StorageClient> client,
        std::shared_ptr<EventHub> hub,
        ActionMessages messages = {})
        : client_{std::move(client)}
        , hub_{std::move(hub)}
        , action_{std::move(name), hub_, std::move(messages)}
    {}
    virtual ~ClientAction() = default;
    ClientAction(ClientAction const&) = delete;
    ClientAction& operator=(ClientAction const&) = delete;
    ClientAction(ClientAction&&) = delete;
    ClientAction& operator=(ClientAction&&) = delete;

    bool busy() const
    {
        return action_.busy();
    }

    void wait()
    {
        action_.wait();
    }

  protected:
    bool submit(std::function<void()> body, std::function<void()> onRejected = {})
    {
        return action_.submit(std::move(body), std::move(onRejected));
    }

    void message(
        std::string text,
        std::chrono::milliseconds duration,
        SharedData::MessageLevel level = SharedData::MessageLevel::Info) const
    {
        hub_->message(std::move(text), duration, level);
    }

    std::string const& name() const
    {
        return action_.name();
    }

  protected:
    std::shared_ptr<Storage::StorageClient> client_;
    std::shared_ptr<EventHub> hub_;

  private:
    GuardedAction action_;
};

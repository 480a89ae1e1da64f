#include <backend/actions/logout_action.hpp>
#include <log/log.hpp>

using namespace std::chrono_literals;

LogoutAction::LogoutAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{"LogoutAction", std::move(client), std::move(hub)}
{}

bool LogoutAction::logout(bool notify)
{
    return submit([this, notify]() {
        if (const auto code = client_->logout(); code != Storage::StatusCode::Success)
        {
            Log::warn("{}: Logout declined: {}.", name(), Storage::describeStatus(code));
            message("Logout failed, please retry.", 5000ms, SharedData::MessageLevel::Error);
            return;
        }
        if (notify)
            hub_->publish(SharedData::LoggedOut{});
        message("Logged out.", 4000ms, SharedData::MessageLevel::Success);
    });
}

#include <backend/actions/login_action.hpp>
#include <log/log.hpp>

using namespace std::chrono_literals;

LoginAction::LoginAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{
          "LoginAction",
          std::move(client),
          std::move(hub),
          ActionMessages{
              .timeout = "Network timeout!",
              .timeoutDuration = 3000ms,
          }}
{}

bool LoginAction::login(std::string username, std::string password, std::optional<std::string> cookie)
{
    return submit([this,
                   username = std::move(username),
                   password = std::move(password),
                   cookie = std::move(cookie)]() {
        if (cookie && !cookie->empty())
        {
            if (client_->loginByCookie(*cookie) == Storage::StatusCode::Success)
            {
                Log::info("{}: Logged in with cookie.", name());
                message("Logged in with cookie.", 5000ms, SharedData::MessageLevel::Success);
                hub_->publish(SharedData::LoginFinished{
                    .success = true, .byCookie = true, .username = username, .cookie = client_->cookie()});
                return;
            }
            Log::info("{}: Cookie was not accepted.", name());
        }

        if (username.empty() || password.empty())
        {
            message("Login failed: no username or password.", 3000ms, SharedData::MessageLevel::Error);
            hub_->publish(SharedData::LoginFinished{.success = false, .byCookie = false, .username = username});
            return;
        }

        if (const auto code = client_->login(username, password); code != Storage::StatusCode::Success)
        {
            Log::warn("{}: Login of '{}' declined: {}.", name(), username, Storage::describeStatus(code));
            message(
                "Login failed, the username or password may be wrong.", 8000ms, SharedData::MessageLevel::Error);
            hub_->publish(SharedData::LoginFinished{.success = false, .byCookie = false, .username = username});
            return;
        }

        Log::info("{}: Logged in as '{}'.", name(), username);
        message("Login successful.", 5000ms, SharedData::MessageLevel::Success);
        hub_->publish(SharedData::LoginFinished{
            .success = true, .byCookie = false, .username = username, .cookie = client_->cookie()});
    });
}

#pragma once

#include <backend/actions/client_action.hpp>

#include <optional>
#include <string>

class LoginAction : public ClientAction
{
  public:
    LoginAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /**
     * @brief Logs in with the cookie if one is given and falls back to the credentials.
     * Publishes LoginFinished.
     */
    bool login(std::string username, std::string password, std::optional<std::string> cookie = std::nullopt);
};

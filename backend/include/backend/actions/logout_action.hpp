#pragma once

#include <backend/actions/client_action.hpp>

class LogoutAction : public ClientAction
{
  public:
    LogoutAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /**
     * @param notify Publish LoggedOut on success.
     */
    bool logout(bool notify = true);
};

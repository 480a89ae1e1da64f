#pragma once

#include <backend/actions/all_actions.hpp>
#include <backend/event_hub.hpp>
#include <backend/transfer/download_dispatcher.hpp>
#include <backend/transfer/upload_dispatcher.hpp>
#include <persistence/settings/settings.hpp>
#include <storage/release_source.hpp>
#include <storage/storage_client.hpp>

#include <memory>
#include <vector>

/**
 * @brief Everything one logged in storage account needs: the transfer dispatchers and all guarded actions,
 * configured from the settings and wired to one event hub.
 *
 * Download jobs resolved by ShareDetailsAction are queued for download automatically.
 */
class Session
{
  public:
    Session(
        std::shared_ptr<Storage::StorageClient> client,
        std::vector<std::shared_ptr<Storage::ReleaseSource>> releaseSources,
        Persistence::Settings settings,
        std::shared_ptr<EventHub> hub = std::make_shared<EventHub>());
    ~Session();
    Session(Session const&) = delete;
    Session& operator=(Session const&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    EventHub& events();
    std::shared_ptr<EventHub> hub() const;
    Persistence::Settings const& settings() const;

    DownloadDispatcher& downloads();
    UploadDispatcher& uploads();

    LoginAction& login();
    LogoutAction& logout();
    ShareInfoAction& shareInfo();
    ShareDetailsAction& shareDetails();
    ListRefreshAction& listRefresh();
    RemoveAction& remove();
    MoreInfoAction& moreInfo();
    MoveAction& move();
    RenameMkdirAction& renameMkdir();
    SetPasswordAction& setPassword();
    RecycleBinListAction& recycleBinList();
    RecycleBinAction& recycleBin();
    UpdateCheckAction& updateCheck();

    /**
     * @brief Checks for a newer release than the configured current version.
     */
    bool checkForUpdates(bool manual);

  private:
    Persistence::Settings settings_;
    std::shared_ptr<Storage::StorageClient> client_;
    std::shared_ptr<EventHub> hub_;

    DownloadDispatcher downloads_;
    UploadDispatcher uploads_;

    LoginAction login_;
    LogoutAction logout_;
    ShareInfoAction shareInfo_;
    ShareDetailsAction shareDetails_;
    ListRefreshAction listRefresh_;
    RemoveAction remove_;
    MoreInfoAction moreInfo_;
    MoveAction move_;
    RenameMkdirAction renameMkdir_;
    SetPasswordAction setPassword_;
    RecycleBinListAction recycleBinList_;
    RecycleBinAction recycleBin_;
    UpdateCheckAction updateCheck_;

    EventHub::SubscriptionId resolvedJobsSubscription_;
};

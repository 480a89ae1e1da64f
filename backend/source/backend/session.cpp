#include <backend/session.hpp>
#include <log/log.hpp>

namespace
{
    Persistence::Settings withDefaults(Persistence::Settings settings)
    {
        settings.useDefaultsFrom(Persistence::Settings::defaults());
        return settings;
    }
}

Session::Session(
    std::shared_ptr<Storage::StorageClient> client,
    std::vector<std::shared_ptr<Storage::ReleaseSource>> releaseSources,
    Persistence::Settings settings,
    std::shared_ptr<EventHub> hub)
    : settings_{withDefaults(std::move(settings))}
    , client_{std::move(client)}
    , hub_{std::move(hub)}
    , downloads_{
          client_,
          hub_,
          DownloadDispatcher::DownloadDispatcherOptions{
              .concurrency = settings_.transfer->concurrency.value(),
              .pollInterval = settings_.transfer->pollInterval.value(),
          }}
    , uploads_{client_, hub_}
    , login_{client_, hub_}
    , logout_{client_, hub_}
    , shareInfo_{client_, hub_, settings_.shareLink->pattern.value()}
    , shareDetails_{client_, hub_}
    , listRefresh_{client_, hub_}
    , remove_{client_, hub_}
    , moreInfo_{client_, hub_}
    , move_{client_, hub_, settings_.actions->moveSettleDelay.value()}
    , renameMkdir_{client_, hub_, settings_.actions->mkdirSettleDelay.value()}
    , setPassword_{client_, hub_}
    , recycleBinList_{client_, hub_}
    , recycleBin_{client_, hub_, settings_.actions->recycleSettleDelay.value()}
    , updateCheck_{hub_, std::move(releaseSources)}
    , resolvedJobsSubscription_{hub_->on<SharedData::DownloadJobsResolved>(
          [this](SharedData::DownloadJobsResolved const& resolved) {
              auto jobs = resolved.jobs;
              for (auto& job : jobs)
              {
                  if (job.destination.empty())
                      job.destination = settings_.transfer->downloadDirectory.value();
              }
              downloads_.addMany(std::move(jobs));
          })}
{
    Log::info("Session: Created with {} parallel downloads.", downloads_.concurrency());
}

Session::~Session()
{
    hub_->unsubscribe(resolvedJobsSubscription_);
}

EventHub& Session::events()
{
    return *hub_;
}
std::shared_ptr<EventHub> Session::hub() const
{
    return hub_;
}
Persistence::Settings const& Session::settings() const
{
    return settings_;
}

DownloadDispatcher& Session::downloads()
{
    return downloads_;
}
UploadDispatcher& Session::uploads()
{
    return uploads_;
}

LoginAction& Session::login()
{
    return login_;
}
LogoutAction& Session::logout()
{
    return logout_;
}
ShareInfoAction& Session::shareInfo()
{
    return shareInfo_;
}
ShareDetailsAction& Session::shareDetails()
{
    return shareDetails_;
}
ListRefreshAction& Session::listRefresh()
{
    return listRefresh_;
}
RemoveAction& Session::remove()
{
    return remove_;
}
MoreInfoAction& Session::moreInfo()
{
    return moreInfo_;
}
MoveAction& Session::move()
{
    return move_;
}
RenameMkdirAction& Session::renameMkdir()
{
    return renameMkdir_;
}
SetPasswordAction& Session::setPassword()
{
    return setPassword_;
}
RecycleBinListAction& Session::recycleBinList()
{
    return recycleBinList_;
}
RecycleBinAction& Session::recycleBin()
{
    return recycleBin_;
}
UpdateCheckAction& Session::updateCheck()
{
    return updateCheck_;
}

bool Session::checkForUpdates(bool manual)
{
    return updateCheck_.check(settings_.update->currentVersion.value(), manual);
}

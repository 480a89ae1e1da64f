#pragma once

#include <backend/actions/guarded_action.hpp>
#include <backend/event_hub.hpp>
#include <storage/release_source.hpp>

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Looks for a newer release. The sources are asked in order until one answers.
 *
 * A manual check reports every outcome. A background check, e.g. at startup, only reports an available update.
 */
class UpdateCheckAction
{
  public:
    UpdateCheckAction(std::shared_ptr<EventHub> hub, std::vector<std::shared_ptr<Storage::ReleaseSource>> sources);

    bool check(std::string currentVersion, bool manual);

    bool busy() const;
    void wait();

  private:
    void report(bool manual, SharedData::UpdateCheckFinished result) const;

  private:
    std::shared_ptr<EventHub> hub_;
    std::vector<std::shared_ptr<Storage::ReleaseSource>> sources_;
    GuardedAction action_;
};

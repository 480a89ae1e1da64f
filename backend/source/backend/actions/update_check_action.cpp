#include <backend/actions/update_check_action.hpp>
#include <log/log.hpp>
#include <utility/version.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>

UpdateCheckAction::UpdateCheckAction(
    std::shared_ptr<EventHub> hub,
    std::vector<std::shared_ptr<Storage::ReleaseSource>> sources)
    : hub_{std::move(hub)}
    , sources_{std::move(sources)}
    , action_{"UpdateCheckAction", hub_}
{}

bool UpdateCheckAction::check(std::string currentVersion, bool manual)
{
    return action_.submit(
        [this, currentVersion = std::move(currentVersion), manual]() {
            std::optional<Storage::ReleaseInfo> release;
            std::vector<std::string> asked;
            for (auto const& source : sources_)
            {
                asked.push_back(source->name());
                try
                {
                    release = source->latestRelease();
                    if (release)
                        break;
                    Log::debug("UpdateCheckAction: {} knows no release.", source->name());
                }
                catch (std::exception const& e)
                {
                    Log::debug("UpdateCheckAction: Asking {} failed: {}", source->name(), e.what());
                }
            }

            if (!release)
            {
                report(
                    manual,
                    {.tag = "v0.0.0",
                     .notes = fmt::format(
                         "Checking for updates failed, {} refused the connection. Please retry later.",
                         fmt::join(asked, ", "))});
                return;
            }

            const auto local = Utility::Version::parse(currentVersion);
            const auto remote = Utility::Version::parse(release->tag);
            if (!local || !remote)
            {
                Log::error(
                    "UpdateCheckAction: Cannot compare '{}' with '{}': {}",
                    currentVersion,
                    release->tag,
                    !local ? local.error() : remote.error());
                report(manual, {.tag = "v0.0.0", .notes = "An error occurred while checking for updates, please retry!"});
                return;
            }

            if (*remote > *local)
            {
                Log::info("UpdateCheckAction: {} is available, running {}.", release->tag, currentVersion);
                hub_->publish(SharedData::UpdateCheckFinished{
                    .tag = release->tag, .notes = release->notes, .updateAvailable = true, .background = !manual});
                return;
            }
            report(manual, {.tag = release->tag, .notes = "No new version has been released yet!"});
        },
        [this, manual]() {
            report(manual, {.tag = "v0.0.0", .notes = "A background task is still running, please wait!"});
        });
}

void UpdateCheckAction::report(bool manual, SharedData::UpdateCheckFinished result) const
{
    if (!manual)
        return;
    result.updateAvailable = false;
    result.background = false;
    hub_->publish(result);
}

bool UpdateCheckAction::busy() const
{
    return action_.busy();
}

void UpdateCheckAction::wait()
{
    action_.wait();
}

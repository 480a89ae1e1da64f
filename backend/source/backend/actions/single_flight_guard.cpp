#include <backend/actions/single_flight_guard.hpp>

#include <utility>

SingleFlightGuard::Ticket::Ticket(SingleFlightGuard* guard)
    : guard_{guard}
{}
SingleFlightGuard::Ticket::Ticket(Ticket&& other) noexcept
    : guard_{std::exchange(other.guard_, nullptr)}
{}
SingleFlightGuard::Ticket& SingleFlightGuard::Ticket::operator=(Ticket&& other) noexcept
{
    if (this != &other)
    {
        release();
        guard_ = std::exchange(other.guard_, nullptr);
    }
    return *this;
}
SingleFlightGuard::Ticket::~Ticket()
{
    release();
}
void SingleFlightGuard::Ticket::release()
{
    if (auto* guard = std::exchange(guard_, nullptr); guard != nullptr)
        guard->release();
}

std::optional<SingleFlightGuard::Ticket> SingleFlightGuard::tryAcquire()
{
    std::scoped_lock lock{mutex_};
    if (busy_)
        return std::nullopt;
    busy_ = true;
    return Ticket{this};
}

bool SingleFlightGuard::busy() const
{
    std::scoped_lock lock{mutex_};
    return busy_;
}

void SingleFlightGuard::release()
{
    std::scoped_lock lock{mutex_};
    busy_ = false;
}

#pragma once

#include <mutex>
#include <optional>

/**
 * @brief A lock guarded busy flag. At most one ticket exists at a time.
 */
class SingleFlightGuard
{
  public:
    /**
     * @brief Proof of holding the guard. Releases it on destruction, exactly once.
     */
    class Ticket
    {
      public:
        Ticket(Ticket const&) = delete;
        Ticket& operator=(Ticket const&) = delete;
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;
        ~Ticket();

        void release();

      private:
        friend class SingleFlightGuard;
        explicit Ticket(SingleFlightGuard* guard);

      private:
        SingleFlightGuard* guard_;
    };

    SingleFlightGuard() = default;
    SingleFlightGuard(SingleFlightGuard const&) = delete;
    SingleFlightGuard& operator=(SingleFlightGuard const&) = delete;
    SingleFlightGuard(SingleFlightGuard&&) = delete;
    SingleFlightGuard& operator=(SingleFlightGuard&&) = delete;

    /**
     * @brief Idle -> Busy.
     *
     * @return A ticket if the guard was idle, nullopt if it is busy.
     */
    std::optional<Ticket> tryAcquire();

    bool busy() const;

  private:
    void release();

  private:
    mutable std::mutex mutex_{};
    bool busy_{false};
};

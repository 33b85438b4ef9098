#pragma once
#include <chrono>
#include <mutex>
#include <optional>

#include "proto/payload.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"
#include "util/constants.hpp"

namespace app
{

enum class State
{
    WindowLocked,   // terminal: code window closed before open
    AwaitingOpen,
    CountingDown,
    OpenReadOnce,
    OpenPermanent,
    Vanishing,      // short grace period before destruction
    Destroyed,      // terminal: content wiped
};

const char *to_string(State s);
bool        is_terminal(State s);

/*
Viewing lifecycle of one reconstructed payload. Built on reconstruction
completion; time-driven transitions are evaluated lazily against the clock
whenever the state is read, so a session that was suspended catches up on
the next query.

  (built) --window passed--> WindowLocked
  (built) ------------------> AwaitingOpen --open--> CountingDown | OpenReadOnce | OpenPermanent
  CountingDown --n s after open--> Vanishing --grace--> Destroyed
  OpenReadOnce --dismiss---------> Vanishing --grace--> Destroyed
*/
class Lifecycle
{
  public:
    Lifecycle(payload::LogicalPayload    p,
              const util::Clock         &clock,
              store::IMessageStore      *store,
              std::chrono::milliseconds  grace = std::chrono::milliseconds(
                  constants::DEFAULT_GRACE_MS));
    ~Lifecycle();

    Lifecycle(const Lifecycle &)            = delete;
    Lifecycle &operator=(const Lifecycle &) = delete;

    State state();
    State open();
    State dismiss();
    // Explicit keep while the message is open; persists at most once.
    bool save();
    // View torn down: freezes the lifecycle without destroying or saving.
    // Content and remaining time are no longer served afterwards.
    void cancel();
    bool cancelled() const;

    // Seconds left, only while CountingDown
    std::optional<double>                  remaining();
    // Copy of the content while it is on screen (open states and Vanishing)
    std::optional<payload::LogicalPayload> content();

    const payload::ExpirationDirective &directive() const { return directive_; }
    bool                                saved() const;

  private:
    State advance_locked(util::TimePoint now);
    void  wipe_locked();

    const util::Clock                     &clock_;
    store::IMessageStore                  *store_;
    const std::chrono::milliseconds        grace_;
    const payload::ExpirationDirective     directive_;
    const std::optional<std::int64_t>      window_deadline_;

    mutable std::mutex                     mu_;
    std::optional<payload::LogicalPayload> content_;
    State                                  state_{State::AwaitingOpen};
    util::TimePoint                        opened_at_{};
    util::TimePoint                        vanish_at_{};
    bool                                   saved_{false};
    bool                                   cancelled_{false};
};

}  // namespace app

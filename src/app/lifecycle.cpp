#include <utility>

#include "app/lifecycle.hpp"
#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace app
{

const char *to_string(State s)
{
    switch (s)
    {
        case State::WindowLocked:
            return "window-locked";
        case State::AwaitingOpen:
            return "awaiting-open";
        case State::CountingDown:
            return "counting-down";
        case State::OpenReadOnce:
            return "open-read-once";
        case State::OpenPermanent:
            return "open-permanent";
        case State::Vanishing:
            return "vanishing";
        case State::Destroyed:
            return "destroyed";
    }
    return "?";
}

bool is_terminal(State s)
{
    return s == State::WindowLocked || s == State::Destroyed;
}

Lifecycle::Lifecycle(payload::LogicalPayload   p,
                     const util::Clock        &clock,
                     store::IMessageStore     *store,
                     std::chrono::milliseconds grace)
    : clock_(clock),
      store_(store),
      grace_(grace),
      directive_(p.expiry),
      window_deadline_(p.window_deadline),
      content_(std::move(p))
{
    std::lock_guard<std::mutex> lock(mu_);
    if (content_->window_expired(clock_.now()))
    {
        state_ = State::WindowLocked;
        wipe_locked();
    }
}

Lifecycle::~Lifecycle()
{
    std::lock_guard<std::mutex> lock(mu_);
    wipe_locked();
}

void Lifecycle::wipe_locked()
{
    if (!content_)
        return;
    crypto::wipe(content_->text);
    if (content_->image)
        crypto::wipe(*content_->image);
    if (content_->audio)
        crypto::wipe(*content_->audio);
    if (content_->signature)
        crypto::wipe(content_->signature->handle);
    content_.reset();
}

State Lifecycle::advance_locked(util::TimePoint now)
{
    if (cancelled_)
        return state_;

    if (state_ == State::AwaitingOpen && window_deadline_ &&
        now > util::from_unix_seconds(*window_deadline_))
    {
        state_ = State::WindowLocked;
        wipe_locked();
        return state_;
    }

    if (state_ == State::CountingDown)
    {
        const auto *c   = std::get_if<payload::CountdownSeconds>(&directive_);
        const auto  end = opened_at_ + std::chrono::seconds(c ? c->seconds : 0);
        if (now >= end)
        {
            state_     = State::Vanishing;
            vanish_at_ = end;
        }
    }

    if (state_ == State::Vanishing && now - vanish_at_ >= grace_)
    {
        state_ = State::Destroyed;
        wipe_locked();
    }
    return state_;
}

State Lifecycle::state()
{
    std::lock_guard<std::mutex> lock(mu_);
    return advance_locked(clock_.now());
}

State Lifecycle::open()
{
    std::lock_guard<std::mutex> lock(mu_);
    const auto                  now = clock_.now();
    if (advance_locked(now) != State::AwaitingOpen || cancelled_)
        return state_;

    if (const auto *c = std::get_if<payload::CountdownSeconds>(&directive_))
    {
        // anchored to when the receiver views it, not when the sender made it
        opened_at_ = now;
        state_     = State::CountingDown;
        LOG_DEBUG("Lifecycle::open: countdown of %u s started", c->seconds);
    }
    else if (std::holds_alternative<payload::ReadOnce>(directive_))
    {
        state_ = State::OpenReadOnce;
    }
    else
    {
        // nothing will ever destroy it, so keep it now
        state_ = State::OpenPermanent;
        if (store_ && !saved_)
        {
            saved_ = store_->save(*content_);
            if (!saved_)
                LOG_WARN("Lifecycle::open: permanent message could not be saved");
        }
    }
    return state_;
}

State Lifecycle::dismiss()
{
    std::lock_guard<std::mutex> lock(mu_);
    const auto                  now = clock_.now();
    const State                 s   = advance_locked(now);
    if (cancelled_)
        return s;
    if (s == State::OpenReadOnce || s == State::CountingDown)
    {
        state_     = State::Vanishing;
        vanish_at_ = now;
        return advance_locked(now);
    }
    // permanent: just ends the viewing session
    return s;
}

bool Lifecycle::save()
{
    std::lock_guard<std::mutex> lock(mu_);
    const State                 s = advance_locked(clock_.now());
    if (cancelled_)
        return false;
    if (s != State::CountingDown && s != State::OpenReadOnce && s != State::OpenPermanent)
        return false;
    if (saved_)
        return true;
    if (!store_)
        return false;
    saved_ = store_->save(*content_);
    return saved_;
}

void Lifecycle::cancel()
{
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
}

bool Lifecycle::cancelled() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
}

bool Lifecycle::saved() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return saved_;
}

std::optional<double> Lifecycle::remaining()
{
    std::lock_guard<std::mutex> lock(mu_);
    const auto                  now = clock_.now();
    if (cancelled_ || advance_locked(now) != State::CountingDown)
        return std::nullopt;
    const auto *c = std::get_if<payload::CountdownSeconds>(&directive_);
    const auto  left = opened_at_ + std::chrono::seconds(c ? c->seconds : 0) - now;
    return std::chrono::duration<double>(left).count();
}

std::optional<payload::LogicalPayload> Lifecycle::content()
{
    std::lock_guard<std::mutex> lock(mu_);
    // a closed viewer serves nothing, whatever the frozen state says
    if (cancelled_)
        return std::nullopt;
    switch (advance_locked(clock_.now()))
    {
        case State::CountingDown:
        case State::OpenReadOnce:
        case State::OpenPermanent:
        case State::Vanishing:
            if (content_)
                return *content_;
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

}  // namespace app

#include <chrono>
#include <gtest/gtest.h>
#include <string>

#include "app/lifecycle.hpp"
#include "proto/payload.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"

using namespace app;
using namespace std::chrono_literals;

namespace
{

payload::LogicalPayload make(payload::ExpirationDirective d)
{
    payload::LogicalPayload p;
    p.text       = "self destructing note";
    p.created_at = 1'700'000'000;
    p.expiry     = d;
    return p;
}

// Store that counts saves without keeping anything
struct CountingStore : public store::IMessageStore
{
    int  saves = 0;
    bool save(const payload::LogicalPayload &) override
    {
        saves++;
        return true;
    }
};

}  // namespace

TEST(Lifecycle, CountdownScenario)
{
    util::ManualClock clock;
    Lifecycle         lc(make(payload::CountdownSeconds{5}), clock, nullptr, 500ms);

    EXPECT_EQ(lc.state(), State::AwaitingOpen);
    EXPECT_FALSE(lc.content().has_value());

    // opened a long time after arrival: the countdown starts now
    clock.advance(1h);
    EXPECT_EQ(lc.open(), State::CountingDown);
    ASSERT_TRUE(lc.content().has_value());

    clock.advance(4900ms);
    EXPECT_EQ(lc.state(), State::CountingDown);
    auto left = lc.remaining();
    ASSERT_TRUE(left.has_value());
    EXPECT_NEAR(*left, 0.1, 1e-6);

    clock.advance(300ms);  // 5.2 s after open
    EXPECT_EQ(lc.state(), State::Vanishing);
    EXPECT_FALSE(lc.remaining().has_value());
    EXPECT_TRUE(lc.content().has_value());

    // grace runs from the end of the countdown, not from the read
    clock.advance(299ms);
    EXPECT_EQ(lc.state(), State::Vanishing);
    clock.advance(1ms);
    EXPECT_EQ(lc.state(), State::Destroyed);
    EXPECT_FALSE(lc.content().has_value());
}

TEST(Lifecycle, SuspendedSessionCatchesUp)
{
    util::ManualClock clock;
    Lifecycle         lc(make(payload::CountdownSeconds{10}), clock, nullptr, 500ms);
    ASSERT_EQ(lc.open(), State::CountingDown);

    // nothing polled the state while the device slept
    clock.advance(2min);
    EXPECT_EQ(lc.state(), State::Destroyed);
}

TEST(Lifecycle, ReadOnceWaitsForDismiss)
{
    util::ManualClock clock;
    Lifecycle         lc(make(payload::ReadOnce{}), clock, nullptr, 500ms);

    ASSERT_EQ(lc.open(), State::OpenReadOnce);
    clock.advance(std::chrono::hours(24 * 30));
    EXPECT_EQ(lc.state(), State::OpenReadOnce);
    EXPECT_FALSE(lc.remaining().has_value());

    EXPECT_EQ(lc.dismiss(), State::Vanishing);
    clock.advance(500ms);
    EXPECT_EQ(lc.state(), State::Destroyed);
    EXPECT_FALSE(lc.content().has_value());
}

TEST(Lifecycle, DismissDuringCountdownVanishesEarly)
{
    util::ManualClock clock;
    Lifecycle         lc(make(payload::CountdownSeconds{60}), clock, nullptr, 0ms);
    ASSERT_EQ(lc.open(), State::CountingDown);
    clock.advance(2s);
    EXPECT_EQ(lc.dismiss(), State::Destroyed);
}

TEST(Lifecycle, PermanentIsSavedOnceAndStays)
{
    util::ManualClock clock;
    CountingStore     store;
    Lifecycle         lc(make(payload::Permanent{}), clock, &store, 500ms);

    EXPECT_EQ(lc.open(), State::OpenPermanent);
    EXPECT_TRUE(lc.saved());
    EXPECT_EQ(store.saves, 1);

    // a second open and an explicit save do not persist again
    EXPECT_EQ(lc.open(), State::OpenPermanent);
    EXPECT_TRUE(lc.save());
    EXPECT_EQ(store.saves, 1);

    clock.advance(std::chrono::hours(24 * 365));
    EXPECT_EQ(lc.dismiss(), State::OpenPermanent);
    EXPECT_TRUE(lc.content().has_value());
}

TEST(Lifecycle, ExplicitSaveOnlyWhileOpen)
{
    util::ManualClock clock;
    CountingStore     store;
    Lifecycle         lc(make(payload::CountdownSeconds{5}), clock, &store, 0ms);

    EXPECT_FALSE(lc.save());  // not opened yet
    ASSERT_EQ(lc.open(), State::CountingDown);
    EXPECT_TRUE(lc.save());
    EXPECT_TRUE(lc.save());
    EXPECT_EQ(store.saves, 1);

    clock.advance(5s);
    EXPECT_EQ(lc.state(), State::Destroyed);
    EXPECT_FALSE(lc.save());
}

TEST(Lifecycle, WindowPassedBeforeArrivalLocks)
{
    util::ManualClock clock;
    auto              p = make(payload::ReadOnce{});
    p.window_deadline   = util::to_unix_seconds(clock.now()) - 1;

    Lifecycle lc(std::move(p), clock, nullptr, 500ms);
    EXPECT_EQ(lc.state(), State::WindowLocked);
    EXPECT_EQ(lc.open(), State::WindowLocked);
    EXPECT_FALSE(lc.content().has_value());
}

TEST(Lifecycle, WindowPassingBeforeOpenLocks)
{
    util::ManualClock clock;
    auto              p = make(payload::CountdownSeconds{5});
    p.window_deadline   = util::to_unix_seconds(clock.now()) + 30;

    Lifecycle lc(std::move(p), clock, nullptr, 500ms);
    EXPECT_EQ(lc.state(), State::AwaitingOpen);
    clock.advance(31s);
    EXPECT_EQ(lc.open(), State::WindowLocked);
    EXPECT_TRUE(is_terminal(lc.state()));
}

TEST(Lifecycle, WindowIrrelevantOnceOpen)
{
    util::ManualClock clock;
    auto              p = make(payload::ReadOnce{});
    p.window_deadline   = util::to_unix_seconds(clock.now()) + 30;

    Lifecycle lc(std::move(p), clock, nullptr, 500ms);
    ASSERT_EQ(lc.open(), State::OpenReadOnce);
    clock.advance(1h);
    EXPECT_EQ(lc.state(), State::OpenReadOnce);
}

TEST(Lifecycle, CancelHasNoSideEffects)
{
    util::ManualClock clock;
    CountingStore     store;
    Lifecycle         lc(make(payload::CountdownSeconds{5}), clock, &store, 500ms);
    ASSERT_EQ(lc.open(), State::CountingDown);

    lc.cancel();
    EXPECT_TRUE(lc.cancelled());
    clock.advance(1h);
    // frozen: no destruction, no save, no further transitions
    EXPECT_EQ(lc.state(), State::CountingDown);
    EXPECT_EQ(lc.dismiss(), State::CountingDown);
    EXPECT_FALSE(lc.save());
    EXPECT_EQ(store.saves, 0);
    // nothing left to read once the viewer is gone
    EXPECT_FALSE(lc.content().has_value());
    EXPECT_FALSE(lc.remaining().has_value());
}

TEST(Lifecycle, CancelStopsServingContentImmediately)
{
    util::ManualClock clock;
    Lifecycle         lc(make(payload::CountdownSeconds{5}), clock, nullptr, 500ms);
    ASSERT_EQ(lc.open(), State::CountingDown);
    ASSERT_TRUE(lc.content().has_value());
    ASSERT_TRUE(lc.remaining().has_value());

    lc.cancel();
    EXPECT_FALSE(lc.content().has_value());
    EXPECT_FALSE(lc.remaining().has_value());
}

TEST(Lifecycle, MisuseIsANoOp)
{
    util::ManualClock clock;
    Lifecycle         lc(make(payload::ReadOnce{}), clock, nullptr, 500ms);

    EXPECT_EQ(lc.dismiss(), State::AwaitingOpen);  // not open yet
    ASSERT_EQ(lc.open(), State::OpenReadOnce);
    EXPECT_EQ(lc.open(), State::OpenReadOnce);
    ASSERT_EQ(lc.dismiss(), State::Vanishing);
    EXPECT_EQ(lc.dismiss(), State::Vanishing);
    EXPECT_EQ(lc.open(), State::Vanishing);
}

TEST(LifecycleState, Names)
{
    EXPECT_STREQ(to_string(State::CountingDown), "counting-down");
    EXPECT_STREQ(to_string(State::WindowLocked), "window-locked");
    EXPECT_TRUE(is_terminal(State::Destroyed));
    EXPECT_FALSE(is_terminal(State::Vanishing));
}

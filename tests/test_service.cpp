#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "app/glyph_service.hpp"
#include "proto/frag.hpp"
#include "proto/payload.hpp"
#include "store/store.hpp"
#include "transport/loopback_transport.hpp"
#include "util/clock.hpp"

using namespace std::chrono_literals;

namespace
{

payload::LogicalPayload note(const std::string &text, payload::ExpirationDirective d)
{
    payload::LogicalPayload p;
    p.text       = text;
    p.created_at = 1'700'000'000;
    p.expiry     = d;
    return p;
}

std::vector<transport::Code> codes_for(const payload::LogicalPayload &p, std::size_t capacity,
                                       frag::Tag tag = frag::Tag::Direct)
{
    std::vector<std::uint8_t> bytes;
    EXPECT_TRUE(payload::encode(p, bytes));
    std::vector<transport::Code> out;
    for (const auto &f : frag::split(bytes, capacity, tag))
        out.push_back(frag::to_code(f));
    return out;
}

// Drop period that does not keep hitting the same position of an n-code cycle
unsigned coprime_drop(std::size_t n)
{
    unsigned d = 2;
    while (n % d == 0)
        d++;
    return d;
}

struct Rig
{
    transport::LoopbackTransport tx;
    util::ManualClock            clock;
    store::MemoryStore           messages;
    store::MemoryContactBook     contacts;
};

}  // namespace

TEST(GlyphServiceLoopback, CycledTransferSurvivesMissedCodes)
{
    Rig        rig;
    const auto msg = note(std::string(1500, 'g'), payload::ReadOnce{});
    const auto n   = codes_for(msg, 64).size();
    ASSERT_GT(n, 10u);

    app::ServiceConfig cfg;
    cfg.capacity   = 64;
    cfg.cadence    = 1ms;
    cfg.drop_every = coprime_drop(n);

    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts, cfg);
    ASSERT_TRUE(svc.start());
    ASSERT_TRUE(svc.send(msg));
    EXPECT_TRUE(svc.sending());

    ASSERT_TRUE(svc.wait_assembled(10s));
    svc.stop_sending();
    EXPECT_FALSE(svc.sending());
    EXPECT_GT(rig.tx.dropped(), 0u);
    EXPECT_FALSE(svc.corrupted());
    EXPECT_DOUBLE_EQ(svc.progress(), 1.0);

    EXPECT_EQ(svc.view_state(), std::optional<app::State>(app::State::AwaitingOpen));
    EXPECT_FALSE(svc.content().has_value());

    EXPECT_EQ(svc.open(), std::optional<app::State>(app::State::OpenReadOnce));
    auto shown = svc.content();
    ASSERT_TRUE(shown.has_value());
    EXPECT_EQ(shown->text, msg.text);

    EXPECT_EQ(svc.dismiss(), std::optional<app::State>(app::State::Vanishing));
    rig.clock.advance(1s);
    EXPECT_EQ(svc.view_state(), std::optional<app::State>(app::State::Destroyed));
    EXPECT_FALSE(svc.content().has_value());
    svc.stop();
}

TEST(GlyphServiceLoopback, ScanIsSynchronousAndLogsAssembly)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);
    const auto        codes = codes_for(note("hello", payload::CountdownSeconds{5}), 16);
    ASSERT_GE(codes.size(), 3u);

    EXPECT_FALSE(svc.view_state().has_value());
    EXPECT_FALSE(svc.partial().has_value());
    for (std::size_t i = 0; i + 1 < codes.size(); i++)
        EXPECT_EQ(svc.scan(codes[i]), frag::IngestResult::Accepted);
    EXPECT_EQ(svc.scan(codes[0]), frag::IngestResult::Duplicate);
    EXPECT_EQ(svc.scan("garbage"), frag::IngestResult::Invalid);
    EXPECT_FALSE(svc.view_state().has_value());

    auto partial = svc.partial();
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial->text, std::optional<std::string>("hello"));

    testing::internal::CaptureStderr();
    EXPECT_EQ(svc.scan(codes.back()), frag::IngestResult::Accepted);
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[RECV] assembled"), std::string::npos);

    EXPECT_TRUE(svc.wait_assembled(0ms));
    EXPECT_EQ(svc.open(), std::optional<app::State>(app::State::CountingDown));
    rig.clock.advance(2s);
    auto left = svc.remaining();
    ASSERT_TRUE(left.has_value());
    EXPECT_NEAR(*left, 3.0, 1e-6);

    rig.clock.advance(10s);
    EXPECT_EQ(svc.view_state(), std::optional<app::State>(app::State::Destroyed));
    svc.stop();
}

TEST(GlyphServiceLoopback, SignedMessageRegistersContact)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    auto msg      = note("follow me", payload::ReadOnce{});
    msg.signature = payload::Signature::make(payload::Platform::YouTube, "@glyphcast");
    for (const auto &c : codes_for(msg, 20))
        (void)svc.scan(c);

    ASSERT_TRUE(svc.wait_assembled(0ms));
    const auto sig = payload::Signature::make(payload::Platform::YouTube, "glyphcast");
    EXPECT_TRUE(rig.contacts.is_contact(sig));

    // the same sender again bumps the existing contact
    svc.reset();
    for (const auto &c : codes_for(msg, 20))
        (void)svc.scan(c);
    ASSERT_TRUE(svc.wait_assembled(0ms));
    EXPECT_EQ(rig.contacts.count(), 1u);
    EXPECT_EQ(rig.contacts.find(sig)->message_count, 2u);
}

TEST(GlyphServiceLoopback, CorruptedTransferHasNoView)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    std::vector<std::uint8_t> bytes;
    ASSERT_TRUE(payload::encode(note("tampered", payload::ReadOnce{}), bytes));
    auto frags = frag::split(bytes, 12, frag::Tag::Direct);
    frags[1].payload[3] ^= 0x40;
    for (const auto &f : frags)
        (void)svc.scan(frag::to_code(f));

    ASSERT_TRUE(svc.wait_assembled(0ms));
    EXPECT_TRUE(svc.corrupted());
    EXPECT_FALSE(svc.view_state().has_value());
    EXPECT_FALSE(svc.open().has_value());

    svc.reset();
    EXPECT_FALSE(svc.corrupted());
    EXPECT_DOUBLE_EQ(svc.progress(), 0.0);
}

TEST(GlyphServiceLoopback, WindowLocksUnopenedMessage)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    auto msg            = note("only for a minute", payload::ReadOnce{});
    msg.window_deadline = util::to_unix_seconds(rig.clock.now()) + 60;
    for (const auto &c : codes_for(msg, 32))
        (void)svc.scan(c);
    ASSERT_TRUE(svc.wait_assembled(0ms));
    EXPECT_EQ(svc.view_state(), std::optional<app::State>(app::State::AwaitingOpen));

    rig.clock.advance(61s);
    EXPECT_EQ(svc.open(), std::optional<app::State>(app::State::WindowLocked));
    EXPECT_FALSE(svc.content().has_value());
}

TEST(GlyphServiceLoopback, LateScanAfterWindowRefused)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    auto msg            = note("late", payload::ReadOnce{});
    msg.window_deadline = util::to_unix_seconds(rig.clock.now()) + 60;
    msg.image           = std::vector<std::uint8_t>(200, 0x33);
    const auto codes    = codes_for(msg, 32);
    ASSERT_GT(codes.size(), 4u);

    // enough of the prefix to see the window field
    for (std::size_t i = 0; i < 3; i++)
        ASSERT_EQ(svc.scan(codes[i]), frag::IngestResult::Accepted);
    rig.clock.advance(2min);
    EXPECT_EQ(svc.scan(codes[3]), frag::IngestResult::WindowExpired);
    EXPECT_FALSE(svc.wait_assembled(0ms));
}

TEST(GlyphServiceLoopback, PermanentSavedOnOpen)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    for (const auto &c : codes_for(note("keep forever", payload::Permanent{}), 40))
        (void)svc.scan(c);
    ASSERT_TRUE(svc.wait_assembled(0ms));
    EXPECT_EQ(rig.messages.size(), 0u);

    EXPECT_EQ(svc.open(), std::optional<app::State>(app::State::OpenPermanent));
    EXPECT_TRUE(svc.save());
    ASSERT_EQ(rig.messages.size(), 1u);
    EXPECT_EQ(rig.messages.items()[0].text, "keep forever");
}

TEST(GlyphServiceLoopback, CloseViewCancelsCountdown)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    for (const auto &c : codes_for(note("brief", payload::CountdownSeconds{3}), 40))
        (void)svc.scan(c);
    ASSERT_TRUE(svc.wait_assembled(0ms));
    ASSERT_EQ(svc.open(), std::optional<app::State>(app::State::CountingDown));

    svc.close_view();
    rig.clock.advance(1min);
    EXPECT_EQ(svc.view_state(), std::optional<app::State>(app::State::CountingDown));
    EXPECT_FALSE(svc.save());
    EXPECT_EQ(rig.messages.size(), 0u);
    EXPECT_FALSE(svc.content().has_value());
    EXPECT_FALSE(svc.remaining().has_value());
}

TEST(GlyphServiceLoopback, DestroyedMessageCannotBeRebuilt)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    const auto codes = codes_for(note("burn after reading", payload::ReadOnce{}), 20);
    ASSERT_GE(codes.size(), 2u);
    for (const auto &c : codes)
        (void)svc.scan(c);
    ASSERT_TRUE(svc.wait_assembled(0ms));

    // the assembler let go of its slices when it handed the message over
    EXPECT_FALSE(svc.partial().has_value());
    EXPECT_DOUBLE_EQ(svc.progress(), 1.0);

    ASSERT_EQ(svc.open(), std::optional<app::State>(app::State::OpenReadOnce));
    ASSERT_EQ(svc.dismiss(), std::optional<app::State>(app::State::Vanishing));
    rig.clock.advance(2s);
    ASSERT_EQ(svc.view_state(), std::optional<app::State>(app::State::Destroyed));

    EXPECT_FALSE(svc.content().has_value());
    EXPECT_FALSE(svc.partial().has_value());
    // the code keeps cycling; re-scans change nothing
    for (const auto &c : codes)
        EXPECT_EQ(svc.scan(c), frag::IngestResult::Duplicate);
    EXPECT_FALSE(svc.partial().has_value());
    EXPECT_EQ(svc.view_state(), std::optional<app::State>(app::State::Destroyed));
}

TEST(GlyphServiceLoopback, LockedMessageCannotBeRebuilt)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    auto msg            = note("gone at noon", payload::ReadOnce{});
    msg.window_deadline = util::to_unix_seconds(rig.clock.now()) + 60;
    for (const auto &c : codes_for(msg, 24))
        (void)svc.scan(c);
    ASSERT_TRUE(svc.wait_assembled(0ms));

    rig.clock.advance(90s);
    ASSERT_EQ(svc.view_state(), std::optional<app::State>(app::State::WindowLocked));
    EXPECT_FALSE(svc.content().has_value());
    EXPECT_FALSE(svc.partial().has_value());
}

TEST(GlyphServiceLoopback, ResetAcceptsDifferentSource)
{
    Rig               rig;
    app::GlyphService svc(rig.tx, rig.clock, rig.messages, rig.contacts);

    const auto first  = codes_for(note("first", payload::ReadOnce{}), 8);
    const auto second = codes_for(note("second source", payload::ReadOnce{}), 5, frag::Tag::Bundle);

    EXPECT_EQ(svc.scan(first[0]), frag::IngestResult::Accepted);
    EXPECT_EQ(svc.scan(second[0]), frag::IngestResult::Rejected);

    svc.reset();
    for (const auto &c : second)
        EXPECT_EQ(svc.scan(c), frag::IngestResult::Accepted);
    ASSERT_TRUE(svc.wait_assembled(0ms));
    ASSERT_EQ(svc.open(), std::optional<app::State>(app::State::OpenReadOnce));
    EXPECT_EQ(svc.content()->text, "second source");
}

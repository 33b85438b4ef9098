#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"

using namespace transport;

TEST(Loopback, CapturesPresentedCode)
{
    LoopbackTransport t;
    Code              captured;

    Settings s{};
    s.role = "loopback";

    ASSERT_TRUE(t.start(s, [&](const Code &c) { captured = c; }));
    EXPECT_TRUE(t.link_ready());

    const Code c = "GLYC:AQEAAAABAAA=";
    EXPECT_TRUE(t.present(c));
    EXPECT_EQ(captured, c);
    EXPECT_EQ(t.presented(), 1u);

    t.stop();
    EXPECT_FALSE(t.link_ready());
}

TEST(Loopback, PresentFailsWhenNotStarted)
{
    LoopbackTransport t;
    EXPECT_FALSE(t.present("GLYC:"));
}

TEST(Loopback, RejectsOversizedCode)
{
    LoopbackTransport t;
    Settings          s{};
    s.max_code_len = 8;
    int captures   = 0;
    ASSERT_TRUE(t.start(s, [&](const Code &) { captures++; }));

    EXPECT_FALSE(t.present(std::string(9, 'A')));
    EXPECT_TRUE(t.present(std::string(8, 'A')));
    EXPECT_EQ(captures, 1);
}

TEST(Loopback, CameraMissesEveryNth)
{
    LoopbackTransport t;
    Settings          s{};
    s.drop_every = 3;

    std::vector<Code> seen;
    ASSERT_TRUE(t.start(s, [&](const Code &c) { seen.push_back(c); }));
    for (int i = 1; i <= 7; i++)
        EXPECT_TRUE(t.present(std::to_string(i)));

    EXPECT_EQ(seen, (std::vector<Code>{"1", "2", "4", "5", "7"}));
    EXPECT_EQ(t.presented(), 7u);
    EXPECT_EQ(t.dropped(), 2u);
}

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>

#include "app/glyph_service.hpp"
#include "ctl/ipc.hpp"
#include "proto/frag.hpp"
#include "proto/payload.hpp"
#include "store/store.hpp"
#include "transport/loopback_transport.hpp"
#include "util/clock.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

static app::GlyphService *g_glyph = nullptr;
static util::SystemClock  g_clock;

// ---------------- helpers ----------------
static std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return {};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

// "30" | "readonce" | "permanent"
static bool parse_expiry(const std::string &tok, payload::ExpirationDirective &out)
{
    if (tok == "readonce")
    {
        out = payload::ReadOnce{};
        return true;
    }
    if (tok == "permanent")
    {
        out = payload::Permanent{};
        return true;
    }
    char         *p = nullptr;
    unsigned long v = std::strtoul(tok.c_str(), &p, 10);
    if (tok.empty() || !p || *p != '\0' || v == 0 || v > 0xFFFFFFFFul)
        return false;
    out = payload::CountdownSeconds{static_cast<std::uint32_t>(v)};
    return true;
}

// SEND <expiry> <window_s> <text...>
static void handle_send(const std::string &args)
{
    std::istringstream in(args);
    std::string        expiry_tok, window_tok;
    if (!(in >> expiry_tok >> window_tok))
    {
        LOG_WARN("CMD: SEND ignored (expect: SEND <expiry> <window_s> <text>)");
        return;
    }
    std::string text;
    std::getline(in, text);
    text = trim(text);
    if (text.empty())
    {
        LOG_WARN("CMD: SEND ignored (empty text)");
        return;
    }

    payload::LogicalPayload p;
    if (!parse_expiry(expiry_tok, p.expiry))
    {
        LOG_WARN("CMD: SEND ignored (bad expiry '%s')", expiry_tok.c_str());
        return;
    }
    char         *end    = nullptr;
    unsigned long window = std::strtoul(window_tok.c_str(), &end, 10);
    if (!end || *end != '\0')
    {
        LOG_WARN("CMD: SEND ignored (bad window '%s')", window_tok.c_str());
        return;
    }

    const auto now = util::to_unix_seconds(g_clock.now());
    p.text         = std::move(text);
    p.created_at   = now;
    if (window > 0)
        p.window_deadline = now + static_cast<std::int64_t>(window);

    LOG_INFO("CMD: SEND %s window=%lus", payload::describe(p.expiry).c_str(), window);
    if (!g_glyph->send(p))
        LOG_WARN("CMD: SEND failed");
}

static void on_line(const std::string &line)
{
    if (!g_glyph)
    {
        LOG_WARN("GlyphService not ready");
        return;
    }
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return;
    }
    if (line.rfind("SEND ", 0) == 0)
    {
        handle_send(line.substr(5));
        return;
    }
    if (line.rfind("SCAN ", 0) == 0)
    {
        const auto r = g_glyph->scan(trim(line.substr(5)));
        LOG_INFO("CMD: SCAN -> %s (%.0f%%)", frag::to_string(r), g_glyph->progress() * 100.0);
        return;
    }
    if (line == "OPEN")
    {
        if (!g_glyph->open())
            LOG_SYSTEM("[VIEW] nothing to open");
        return;
    }
    if (line == "DISMISS")
    {
        if (!g_glyph->dismiss())
            LOG_SYSTEM("[VIEW] nothing to dismiss");
        return;
    }
    if (line == "SAVE")
    {
        (void)g_glyph->save();
        return;
    }
    if (line == "CLOSE")
    {
        g_glyph->close_view();
        return;
    }
    if (line == "STATUS")
    {
        g_glyph->log_status();
        return;
    }
    if (line == "RESET")
    {
        g_glyph->reset();
        return;
    }
    if (line == "STOP")
    {
        g_glyph->stop_sending();
        return;
    }
    LOG_WARN("Unknown command: %s", line.c_str());
}

int main()
{
    // log level from env var
    if (const char *log_level = std::getenv("GLYPH_LOG_LEVEL"))
        glyph::set_log_level_by_name(log_level);

    const app::ServiceConfig cfg = app::config_from_env();
    LOG_SYSTEM("Config: capacity=%zu cadence=%lldms grace=%lldms drop_every=%u", cfg.capacity,
               static_cast<long long>(cfg.cadence.count()),
               static_cast<long long>(cfg.grace.count()), cfg.drop_every);

    transport::LoopbackTransport tx;
    store::MemoryStore           messages;
    store::MemoryContactBook     contacts;

    app::GlyphService glyph(tx, g_clock, messages, contacts, cfg);
    if (!glyph.start())
    {
        LOG_ERROR("GlyphService start failed");
        return 1;
    }
    g_glyph = &glyph;

    // IPC server
    const std::string sock = ipc::expand_user(constants::ctl_sock_path());
    const bool        ok   = ipc::start_server(sock, &on_line);
    g_glyph                = nullptr;
    glyph.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    return 0;
}

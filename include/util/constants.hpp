#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace constants
{
// Slice bytes per optical code. Lower-density codes scan far more reliably
// off a cycling display, so the default stays well under the QR maximum.
inline constexpr std::size_t DEFAULT_CAPACITY = 800;
inline constexpr std::size_t MIN_CAPACITY     = 16;

inline constexpr unsigned DEFAULT_CADENCE_MS = 250;
inline constexpr unsigned DEFAULT_GRACE_MS   = 500;  // Vanishing -> Destroyed

// Unsigned knob from the environment; unset, malformed or out-of-range
// values fall back to def.
[[maybe_unused]] static unsigned long env_in_range(const char *name, unsigned long lo,
                                                   unsigned long hi, unsigned long def)
{
    const char *e = std::getenv(name);
    if (!e)
        return def;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && p != e && *p == '\0' && v >= lo && v <= hi)
    {
        LOG_INFO("Using %s=%lu", name, v);
        return v;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", name, e, lo, hi);
    return def;
}

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("GLYPH_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/glyph/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "util/clock.hpp"

/*
Serialized payload (all integers big-endian):

  'G' 'L' VER                          descriptor, 3B
  [type 1B][len 4B][value len B] ...   fields, strictly ascending type
  [0x7F][16][BLAKE2b-128 of all preceding bytes]

Fields: text(req), created(req), expiry(req), window, signature,
flash-on-scan, image, audio. Text comes first so a truncated prefix still
yields it; the bulky media fields come last.
*/

namespace payload
{

inline constexpr std::uint8_t MAGIC0          = 'G';
inline constexpr std::uint8_t MAGIC1          = 'L';
inline constexpr std::uint8_t FORMAT_VER      = 0x02;
inline constexpr std::size_t  DESCRIPTOR_SIZE = 3;
inline constexpr std::size_t  FIELD_HDR_SIZE  = 5;

inline constexpr std::uint8_t T_TEXT      = 0x01;
inline constexpr std::uint8_t T_CREATED   = 0x02;
inline constexpr std::uint8_t T_EXPIRY    = 0x03;
inline constexpr std::uint8_t T_WINDOW    = 0x04;
inline constexpr std::uint8_t T_SIGNATURE = 0x05;
inline constexpr std::uint8_t T_FLASH     = 0x06;
inline constexpr std::uint8_t T_IMAGE     = 0x10;
inline constexpr std::uint8_t T_AUDIO     = 0x11;
inline constexpr std::uint8_t T_DIGEST    = 0x7F;

// --- Expiration directive: exactly one of three ---
struct CountdownSeconds
{
    std::uint32_t seconds{0};  // > 0
    bool          operator==(const CountdownSeconds &o) const { return seconds == o.seconds; }
};
struct ReadOnce
{
    bool operator==(const ReadOnce &) const { return true; }
};
struct Permanent
{
    bool operator==(const Permanent &) const { return true; }
};

using ExpirationDirective = std::variant<CountdownSeconds, ReadOnce, Permanent>;

std::string describe(const ExpirationDirective &e);

// --- Sender attribution ---
enum class Platform : std::uint8_t
{
    Instagram = 1,
    X         = 2,
    TikTok    = 3,
    Snapchat  = 4,
    YouTube   = 5,
    Threads   = 6,
};

const char *platform_name(Platform p);
bool        platform_from_u8(std::uint8_t v, Platform &out);

// Profile link for a handle; empty when the handle is blank after cleanup.
std::string profile_url(Platform p, std::string_view handle);

struct Signature
{
    Platform    platform{Platform::Instagram};
    std::string handle;  // stored without '@'

    // Trims whitespace and drops every '@'
    static Signature make(Platform p, std::string_view handle);

    std::string display_text() const;  // "@user on Instagram"
    std::string profile_url() const { return payload::profile_url(platform, handle); }

    bool operator==(const Signature &o) const
    {
        return platform == o.platform && handle == o.handle;
    }
    bool operator!=(const Signature &o) const { return !(*this == o); }
};

struct LogicalPayload
{
    std::string                              text;
    std::optional<std::vector<std::uint8_t>> image;
    std::optional<std::vector<std::uint8_t>> audio;
    std::optional<Signature>                 signature;
    std::optional<bool>                      flash_on_scan;
    std::int64_t                             created_at{0};  // unix seconds
    ExpirationDirective                      expiry{ReadOnce{}};
    std::optional<std::int64_t>              window_deadline;  // unix seconds, TransferWindow

    bool window_expired(util::TimePoint now) const
    {
        return window_deadline && now > util::from_unix_seconds(*window_deadline);
    }

    bool operator==(const LogicalPayload &o) const;
    bool operator!=(const LogicalPayload &o) const { return !(*this == o); }
};

enum class DecodeStatus
{
    Ok,
    MalformedPayload,
    UnsupportedVersion,
};

const char *to_string(DecodeStatus s);

// Returns false (and logs) for payloads the format cannot carry, e.g. a zero
// countdown or a field larger than 4 GiB.
bool         encode(const LogicalPayload &in, std::vector<std::uint8_t> &out);
DecodeStatus decode(const std::vector<std::uint8_t> &in, LogicalPayload &out);
DecodeStatus decode(const std::uint8_t *in, std::size_t len, LogicalPayload &out);

// --- Truncation-tolerant decode ---

// The first field whose value is cut off by the end of the prefix.
struct PendingField
{
    std::uint8_t  type{0};
    std::uint32_t declared_len{0};
    std::size_t   have{0};
};

struct PartialPayload
{
    std::size_t                              prefix_len{0};  // bytes examined
    std::size_t                              used_len{0};    // bytes in whole fields
    std::uint8_t                             last_type{0};   // type of the last whole field
    std::optional<std::string>               text;
    std::optional<std::int64_t>              created_at;
    std::optional<ExpirationDirective>       expiry;
    std::optional<std::int64_t>              window_deadline;
    std::optional<Signature>                 signature;
    std::optional<bool>                      flash_on_scan;
    std::optional<std::vector<std::uint8_t>> image;
    std::optional<std::vector<std::uint8_t>> audio;
    std::optional<PendingField>              pending;
    bool                                     complete{false};  // digest reached and matched
};

// Recovers every field wholly contained in the prefix and stops at the first
// field that is cut off or fails to parse. nullopt only when the descriptor
// itself is missing or unrecognised.
std::optional<PartialPayload> decode_partial(const std::uint8_t *in, std::size_t len);

}  // namespace payload

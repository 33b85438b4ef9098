#include <cstring>
#include <limits>

#include "crypto/sodium_util.hpp"
#include "proto/payload.hpp"
#include "util/log.hpp"

namespace payload
{

namespace
{

constexpr std::uint8_t EXP_COUNTDOWN = 1;
constexpr std::uint8_t EXP_READ_ONCE = 2;
constexpr std::uint8_t EXP_PERMANENT = 3;

void put_u32(std::vector<std::uint8_t> &out, std::uint32_t v)
{
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void put_i64(std::vector<std::uint8_t> &out, std::int64_t s)
{
    const auto v = static_cast<std::uint64_t>(s);
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
}

std::uint32_t get_u32(const std::uint8_t *p)
{
    return ((std::uint32_t)p[0] << 24) | ((std::uint32_t)p[1] << 16) |
           ((std::uint32_t)p[2] << 8) | (std::uint32_t)p[3];
}

std::int64_t get_i64(const std::uint8_t *p)
{
    std::uint64_t v = 0;
    for (int i = 0; i < 8; i++)
        v = (v << 8) | p[i];
    return static_cast<std::int64_t>(v);
}

bool put_field(std::vector<std::uint8_t> &out, std::uint8_t type, const std::uint8_t *v,
               std::size_t len)
{
    if (len > std::numeric_limits<std::uint32_t>::max())
    {
        LOG_ERROR("encode: field 0x%02x too large (%zu bytes)", type, len);
        return false;
    }
    out.push_back(type);
    put_u32(out, static_cast<std::uint32_t>(len));
    if (len)
        out.insert(out.end(), v, v + len);
    return true;
}

// Decoded fields, shared by the strict and the tolerant decoder
struct Fields
{
    std::optional<std::string>               text;
    std::optional<std::int64_t>              created_at;
    std::optional<ExpirationDirective>       expiry;
    std::optional<std::int64_t>              window_deadline;
    std::optional<Signature>                 signature;
    std::optional<bool>                      flash_on_scan;
    std::optional<std::vector<std::uint8_t>> image;
    std::optional<std::vector<std::uint8_t>> audio;
};

// false => value malformed for its type
bool parse_field(std::uint8_t type, const std::uint8_t *v, std::uint32_t len, Fields &f)
{
    switch (type)
    {
        case T_TEXT:
            f.text.emplace(reinterpret_cast<const char *>(v), len);
            return true;
        case T_CREATED:
        case T_WINDOW:
            if (len != 8)
                return false;
            (type == T_CREATED ? f.created_at : f.window_deadline) = get_i64(v);
            return true;
        case T_EXPIRY:
        {
            if (len != 5)
                return false;
            const std::uint32_t secs = get_u32(v + 1);
            switch (v[0])
            {
                case EXP_COUNTDOWN:
                    if (secs == 0)
                        return false;
                    f.expiry = CountdownSeconds{secs};
                    return true;
                case EXP_READ_ONCE:
                    if (secs != 0)
                        return false;
                    f.expiry = ReadOnce{};
                    return true;
                case EXP_PERMANENT:
                    if (secs != 0)
                        return false;
                    f.expiry = Permanent{};
                    return true;
                default:
                    return false;
            }
        }
        case T_SIGNATURE:
        {
            Platform p{};
            if (len < 1 || !platform_from_u8(v[0], p))
                return false;
            Signature s;
            s.platform = p;
            s.handle.assign(reinterpret_cast<const char *>(v + 1), len - 1);
            f.signature = std::move(s);
            return true;
        }
        case T_FLASH:
            if (len != 1 || v[0] > 1)
                return false;
            f.flash_on_scan = (v[0] == 1);
            return true;
        case T_IMAGE:
            f.image.emplace(v, v + len);
            return true;
        case T_AUDIO:
            f.audio.emplace(v, v + len);
            return true;
        default:  // ignore field if unknown
            return true;
    }
}

bool descriptor_ok(const std::uint8_t *in, std::size_t len)
{
    return len >= DESCRIPTOR_SIZE && in[0] == MAGIC0 && in[1] == MAGIC1 && in[2] == FORMAT_VER;
}

}  // namespace

std::string describe(const ExpirationDirective &e)
{
    if (const auto *c = std::get_if<CountdownSeconds>(&e))
        return std::to_string(c->seconds) + "s";
    if (std::holds_alternative<ReadOnce>(e))
        return "read-once";
    return "permanent";
}

const char *platform_name(Platform p)
{
    switch (p)
    {
        case Platform::Instagram:
            return "Instagram";
        case Platform::X:
            return "X";
        case Platform::TikTok:
            return "TikTok";
        case Platform::Snapchat:
            return "Snapchat";
        case Platform::YouTube:
            return "YouTube";
        case Platform::Threads:
            return "Threads";
    }
    return "?";
}

bool platform_from_u8(std::uint8_t v, Platform &out)
{
    if (v < static_cast<std::uint8_t>(Platform::Instagram) ||
        v > static_cast<std::uint8_t>(Platform::Threads))
        return false;
    out = static_cast<Platform>(v);
    return true;
}

static std::string clean_handle(std::string_view handle)
{
    std::string s;
    s.reserve(handle.size());
    for (char c : handle)
    {
        if (c != '@')
            s.push_back(c);
    }
    const auto whitespace = " \t\r\n";
    const auto l          = s.find_first_not_of(whitespace);
    if (l == std::string::npos)
        return {};
    const auto r = s.find_last_not_of(whitespace);
    return s.substr(l, r - l + 1);
}

std::string profile_url(Platform p, std::string_view handle)
{
    const std::string h = clean_handle(handle);
    if (h.empty())
        return {};
    switch (p)
    {
        case Platform::Instagram:
            return "https://instagram.com/" + h;
        case Platform::X:
            return "https://x.com/" + h;
        case Platform::TikTok:
            return "https://tiktok.com/@" + h;
        case Platform::Snapchat:
            return "https://snapchat.com/add/" + h;
        case Platform::YouTube:
            return "https://youtube.com/@" + h;
        case Platform::Threads:
            return "https://threads.net/@" + h;
    }
    return {};
}

Signature Signature::make(Platform p, std::string_view handle)
{
    Signature s;
    s.platform = p;
    s.handle   = clean_handle(handle);
    return s;
}

std::string Signature::display_text() const
{
    return "@" + handle + " on " + platform_name(platform);
}

bool LogicalPayload::operator==(const LogicalPayload &o) const
{
    return text == o.text && image == o.image && audio == o.audio && signature == o.signature &&
           flash_on_scan == o.flash_on_scan && created_at == o.created_at &&
           expiry == o.expiry && window_deadline == o.window_deadline;
}

const char *to_string(DecodeStatus s)
{
    switch (s)
    {
        case DecodeStatus::Ok:
            return "ok";
        case DecodeStatus::MalformedPayload:
            return "malformed payload";
        case DecodeStatus::UnsupportedVersion:
            return "unsupported version";
    }
    return "?";
}

bool encode(const LogicalPayload &in, std::vector<std::uint8_t> &out)
{
    out.clear();
    out.reserve(DESCRIPTOR_SIZE + in.text.size() + (in.image ? in.image->size() : 0) +
                (in.audio ? in.audio->size() : 0) + 96);
    out.push_back(MAGIC0);
    out.push_back(MAGIC1);
    out.push_back(FORMAT_VER);

    bool ok = put_field(out, T_TEXT, reinterpret_cast<const std::uint8_t *>(in.text.data()),
                        in.text.size());

    std::vector<std::uint8_t> v;
    put_i64(v, in.created_at);
    ok = ok && put_field(out, T_CREATED, v.data(), v.size());

    v.clear();
    if (const auto *c = std::get_if<CountdownSeconds>(&in.expiry))
    {
        if (c->seconds == 0)
        {
            LOG_ERROR("encode: countdown must be > 0 seconds");
            out.clear();
            return false;
        }
        v.push_back(EXP_COUNTDOWN);
        put_u32(v, c->seconds);
    }
    else
    {
        v.push_back(std::holds_alternative<ReadOnce>(in.expiry) ? EXP_READ_ONCE : EXP_PERMANENT);
        put_u32(v, 0);
    }
    ok = ok && put_field(out, T_EXPIRY, v.data(), v.size());

    if (in.window_deadline)
    {
        v.clear();
        put_i64(v, *in.window_deadline);
        ok = ok && put_field(out, T_WINDOW, v.data(), v.size());
    }
    if (in.signature)
    {
        v.clear();
        v.push_back(static_cast<std::uint8_t>(in.signature->platform));
        v.insert(v.end(), in.signature->handle.begin(), in.signature->handle.end());
        ok = ok && put_field(out, T_SIGNATURE, v.data(), v.size());
    }
    if (in.flash_on_scan)
    {
        const std::uint8_t b = *in.flash_on_scan ? 1 : 0;
        ok                   = ok && put_field(out, T_FLASH, &b, 1);
    }
    if (in.image)
        ok = ok && put_field(out, T_IMAGE, in.image->data(), in.image->size());
    if (in.audio)
        ok = ok && put_field(out, T_AUDIO, in.audio->data(), in.audio->size());

    crypto::Digest d{};
    ok = ok && crypto::digest(out.data(), out.size(), d);
    if (!ok)
    {
        out.clear();
        return false;
    }
    put_field(out, T_DIGEST, d.data(), d.size());
    return true;
}

DecodeStatus decode(const std::vector<std::uint8_t> &in, LogicalPayload &out)
{
    return decode(in.data(), in.size(), out);
}

DecodeStatus decode(const std::uint8_t *in, std::size_t len, LogicalPayload &out)
{
    if (len < DESCRIPTOR_SIZE)
    {
        LOG_DEBUG("decode: too short for descriptor (%zu)", len);
        return DecodeStatus::MalformedPayload;
    }
    if (!descriptor_ok(in, len))
    {
        LOG_DEBUG("decode: unsupported descriptor %02x %02x %02x", in[0], in[1], in[2]);
        return DecodeStatus::UnsupportedVersion;
    }

    Fields      f;
    std::size_t i         = DESCRIPTOR_SIZE;
    int         last_type = 0;
    bool        have_dig  = false;
    while (i < len)
    {
        if (len - i < FIELD_HDR_SIZE)
        {
            LOG_DEBUG("decode: truncated field header at %zu", i);
            return DecodeStatus::MalformedPayload;
        }
        const std::size_t   start = i;
        const std::uint8_t  t     = in[i];
        const std::uint32_t L     = get_u32(in + i + 1);
        i += FIELD_HDR_SIZE;
        if (L > len - i)
        {
            LOG_DEBUG("decode: field 0x%02x overruns buffer (%u > %zu)", t, L, len - i);
            return DecodeStatus::MalformedPayload;
        }
        if (t <= last_type)
        {
            LOG_DEBUG("decode: field 0x%02x out of order", t);
            return DecodeStatus::MalformedPayload;
        }
        last_type = t;

        if (t == T_DIGEST)
        {
            if (L != crypto::DIGEST_SIZE || i + L != len)
            {
                LOG_DEBUG("decode: bad digest field (len=%u, trailing=%zu)", L, len - i - L);
                return DecodeStatus::MalformedPayload;
            }
            crypto::Digest d{};
            if (!crypto::digest(in, start, d) || std::memcmp(d.data(), in + i, d.size()) != 0)
            {
                LOG_DEBUG("decode: digest mismatch");
                return DecodeStatus::MalformedPayload;
            }
            have_dig = true;
            i += L;
            break;
        }
        if (t > T_DIGEST || !parse_field(t, in + i, L, f))
        {
            LOG_DEBUG("decode: invalid field 0x%02x (len=%u)", t, L);
            return DecodeStatus::MalformedPayload;
        }
        i += L;
    }

    if (!have_dig || !f.text || !f.created_at || !f.expiry)
    {
        LOG_DEBUG("decode: missing required field");
        return DecodeStatus::MalformedPayload;
    }

    LogicalPayload p;
    p.text            = std::move(*f.text);
    p.created_at      = *f.created_at;
    p.expiry          = *f.expiry;
    p.window_deadline = f.window_deadline;
    p.signature       = std::move(f.signature);
    p.flash_on_scan   = f.flash_on_scan;
    p.image           = std::move(f.image);
    p.audio           = std::move(f.audio);
    out               = std::move(p);
    return DecodeStatus::Ok;
}

std::optional<PartialPayload> decode_partial(const std::uint8_t *in, std::size_t len)
{
    if (!descriptor_ok(in, len))
        return std::nullopt;

    PartialPayload r;
    r.prefix_len = len;
    r.used_len   = DESCRIPTOR_SIZE;

    Fields      f;
    std::size_t i         = DESCRIPTOR_SIZE;
    int         last_type = 0;
    while (len - i >= FIELD_HDR_SIZE)
    {
        const std::uint8_t  t = in[i];
        const std::uint32_t L = get_u32(in + i + 1);
        if (t <= last_type)
            break;
        if (L > len - i - FIELD_HDR_SIZE)
        {
            r.pending = PendingField{t, L, len - i - FIELD_HDR_SIZE};
            break;
        }
        const std::uint8_t *v = in + i + FIELD_HDR_SIZE;
        if (t == T_DIGEST)
        {
            crypto::Digest d{};
            r.complete = L == crypto::DIGEST_SIZE && crypto::digest(in, i, d) &&
                         std::memcmp(d.data(), v, d.size()) == 0;
            if (r.complete)
                r.used_len = i + FIELD_HDR_SIZE + L;
            break;
        }
        if (t > T_DIGEST || !parse_field(t, v, L, f))
            break;
        last_type = t;
        i += FIELD_HDR_SIZE + L;
        r.used_len  = i;
        r.last_type = t;
    }

    r.text            = std::move(f.text);
    r.created_at      = f.created_at;
    r.expiry          = f.expiry;
    r.window_deadline = f.window_deadline;
    r.signature       = std::move(f.signature);
    r.flash_on_scan   = f.flash_on_scan;
    r.image           = std::move(f.image);
    r.audio           = std::move(f.audio);
    return r;
}

}  // namespace payload

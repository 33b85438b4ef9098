#include <algorithm>
#include <arpa/inet.h>  // htons, ntohs
#include <cstdint>
#include <cstring>

#include "crypto/sodium_util.hpp"
#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

const char *tag_name(Tag t)
{
    switch (t)
    {
        case Tag::Direct:
            return "direct";
        case Tag::Bundle:
            return "bundle";
        case Tag::SurveyResponse:
            return "survey-response";
    }
    return "?";
}

bool tag_from_u8(std::uint8_t v, Tag &out)
{
    if (v < static_cast<std::uint8_t>(Tag::Direct) ||
        v > static_cast<std::uint8_t>(Tag::SurveyResponse))
        return false;
    out = static_cast<Tag>(v);
    return true;
}

std::vector<Fragment> split(const std::vector<std::uint8_t> &payload,
                            std::size_t                      capacity,
                            Tag                              tag)
{
    if (capacity < 1 || capacity > UINT16_MAX)
    {
        LOG_ERROR("split: invalid capacity (%zu)", capacity);
        return {};
    }
    std::vector<Fragment> out;
    if (payload.empty())
    {
        // still one code, so the transfer can be shown and completed
        Fragment f;
        f.hdr.tag   = tag;
        f.hdr.index = 0;
        f.hdr.total = 1;
        f.hdr.len   = 0;
        out.push_back(std::move(f));
        return out;
    }

    const std::size_t n = (payload.size() + capacity - 1) / capacity;
    if (n > UINT16_MAX)
    {
        LOG_ERROR("split: payload too large (%zu bytes, needs %zu fragments)", payload.size(), n);
        return {};
    }

    out.reserve(n);
    for (std::size_t i = 0; i < n; i++)
    {
        const std::size_t start = i * capacity;
        const std::size_t take  = std::min(capacity, payload.size() - start);
        Fragment          f;
        f.hdr.tag   = tag;
        f.hdr.index = static_cast<std::uint16_t>(i);
        f.hdr.total = static_cast<std::uint16_t>(n);
        f.hdr.len   = static_cast<std::uint16_t>(take);
        f.payload.assign(payload.begin() + start, payload.begin() + start + take);
        out.push_back(std::move(f));
    }
    return out;
}

std::vector<std::uint8_t> serialize(const Fragment &f)
{
    if (f.payload.size() != f.hdr.len)
    {
        LOG_ERROR("serialize: payload size mismatch (%zu != %u)", f.payload.size(),
                  static_cast<unsigned>(f.hdr.len));
        return {};
    }

    std::vector<std::uint8_t> out(HDR_SIZE + f.payload.size());
    if (!pack_header(f.hdr, out.data()))
    {
        LOG_ERROR("serialize: invalid header");
        return {};
    }
    if (!f.payload.empty())
        std::memcpy(out.data() + HDR_SIZE, f.payload.data(), f.payload.size());
    return out;
}

std::string to_code(const Fragment &f)
{
    const auto frame = serialize(f);
    if (frame.empty())
        return {};
    return std::string(CODE_PREFIX) + crypto::to_base64(frame.data(), frame.size());
}

std::optional<Fragment> parse(const std::vector<std::uint8_t> &frame)
{
    Header h{};
    if (frame.size() < HDR_SIZE)
    {
        LOG_DEBUG("parse: frame too short (%zu)", frame.size());
        return std::nullopt;
    }
    if (!unpack_header(frame.data(), h))
    {
        LOG_DEBUG("parse: invalid header");
        return std::nullopt;
    }
    const std::size_t expected = HDR_SIZE + static_cast<std::size_t>(h.len);
    if (frame.size() != expected)
    {
        LOG_DEBUG("parse: size mismatch (got %zu, expect %zu)", frame.size(), expected);
        return std::nullopt;
    }
    Fragment f;
    f.hdr = h;
    if (h.len)
        f.payload.assign(frame.begin() + HDR_SIZE, frame.end());
    return f;
}

std::optional<Fragment> parse_code(std::string_view code)
{
    const auto whitespace = " \t\r\n";
    const auto l          = code.find_first_not_of(whitespace);
    if (l == std::string_view::npos)
        return std::nullopt;
    const auto r = code.find_last_not_of(whitespace);
    code         = code.substr(l, r - l + 1);

    if (code.substr(0, CODE_PREFIX.size()) != CODE_PREFIX)
    {
        LOG_DEBUG("parse_code: not a fragment code");
        return std::nullopt;
    }
    std::vector<std::uint8_t> frame;
    if (!crypto::from_base64(code.substr(CODE_PREFIX.size()), frame))
    {
        LOG_DEBUG("parse_code: bad base64");
        return std::nullopt;
    }
    return parse(frame);
}

static bool header_valid(const Header &h)
{
    Tag t{};
    if (h.ver != PROTO_VER)
        return false;
    if (!tag_from_u8(static_cast<std::uint8_t>(h.tag), t))
        return false;
    if (h.total == 0)
        return false;
    if (h.index >= h.total)
        return false;
    if (h.len > MAX_SLICE)
        return false;
    return true;
}

bool pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    if (!header_valid(in))
        return false;

    out[0] = in.ver;
    out[1] = static_cast<std::uint8_t>(in.tag);

    std::uint16_t index_be = htons(in.index);
    std::memcpy(out + 2, &index_be, sizeof index_be);

    std::uint16_t total_be = htons(in.total);
    std::memcpy(out + 4, &total_be, sizeof total_be);

    std::uint16_t len_be = htons(in.len);
    std::memcpy(out + 6, &len_be, sizeof len_be);

    return true;
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.ver = in[0];
    // range-checked by header_valid below
    out.tag = static_cast<Tag>(in[1]);

    std::uint16_t index_be;
    std::memcpy(&index_be, in + 2, sizeof index_be);
    out.index = ntohs(index_be);

    std::uint16_t total_be;
    std::memcpy(&total_be, in + 4, sizeof total_be);
    out.total = ntohs(total_be);

    std::uint16_t len_be;
    std::memcpy(&len_be, in + 6, sizeof len_be);
    out.len = ntohs(len_be);

    return header_valid(out);
}

}  // namespace frag

#include <sodium.h>

#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace crypto
{

static_assert(DIGEST_SIZE >= crypto_generichash_BYTES_MIN, "digest too short");
static_assert(DIGEST_SIZE <= crypto_generichash_BYTES_MAX, "digest too long");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

bool digest(const std::uint8_t *in, std::size_t len, Digest &out)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("digest: sodium_init failed");
        return false;
    }
    if (crypto_generichash(out.data(), out.size(), in, len, nullptr, 0) != 0)
    {
        LOG_ERROR("digest: crypto_generichash failed (%zu bytes)", len);
        return false;
    }
    return true;
}

std::string to_base64(const std::uint8_t *in, std::size_t len)
{
    ensure_sodium_init();
    const std::size_t cap = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string       out(cap, '\0');
    // output is NUL-terminated, so cap includes one extra byte
    sodium_bin2base64(out.data(), cap, in, len, sodium_base64_VARIANT_ORIGINAL);
    out.resize(cap - 1);
    return out;
}

bool from_base64(std::string_view in, std::vector<std::uint8_t> &out)
{
    ensure_sodium_init();
    out.clear();
    if (in.empty())
        return true;
    if (in.size() % 4 != 0)
        return false;

    out.resize(in.size() / 4 * 3);
    std::size_t real_len = 0;
    const char *end      = nullptr;
    if (sodium_base642bin(out.data(), out.size(), in.data(), in.size(), nullptr, &real_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        out.clear();
        return false;
    }
    // trailing garbage after the padding
    if (end != in.data() + in.size())
    {
        out.clear();
        return false;
    }
    out.resize(real_len);
    return true;
}

void wipe(std::vector<std::uint8_t> &buf)
{
    if (!buf.empty())
        sodium_memzero(buf.data(), buf.size());
    buf.clear();
    buf.shrink_to_fit();
}

void wipe(std::string &s)
{
    if (!s.empty())
        sodium_memzero(s.data(), s.size());
    s.clear();
    s.shrink_to_fit();
}

}  // namespace crypto

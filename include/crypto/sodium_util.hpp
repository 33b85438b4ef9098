#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace crypto
{

// BLAKE2b output length used by the payload codec. Detects accidental
// corruption only; nothing here is keyed.
constexpr std::size_t DIGEST_SIZE = 16;  // crypto_generichash_BYTES_MIN

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

bool digest(const std::uint8_t *in, std::size_t len, Digest &out);

// Standard (RFC 4648, padded) base64, the text form carried by an optical code
std::string to_base64(const std::uint8_t *in, std::size_t len);
bool        from_base64(std::string_view in, std::vector<std::uint8_t> &out);

// Overwrite then release
void wipe(std::vector<std::uint8_t> &buf);
void wipe(std::string &s);

}  // namespace crypto

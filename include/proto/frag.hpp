#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*
TX:
service.send(LogicalPayload)
  -> payload::encode(...) = descriptor + fields + digest
     -> split(bytes, capacity, tag)
        -> for each Fragment {hdr, slice}:
             to_code(Fragment)  // "GLYC:" + base64([8B header][slice])
               -> presented in a repeating cycle, one optical code at a time

RX:
camera decode -> code text
  -> parse_code(text)  // validate and extract Fragment [hdr, slice]
      -> ok? assembler.ingest(Fragment)
            -> complete ? assembler.finalize() -> LogicalPayload -> lifecycle
*/

namespace frag
{

// --- Protocol constants ---
inline constexpr std::uint8_t     PROTO_VER   = 1;
inline constexpr std::size_t      HDR_SIZE    = 8;
inline constexpr std::size_t      MAX_SLICE   = 2048;  // fits a version-40 code at level L
inline constexpr std::string_view CODE_PREFIX = "GLYC:";

enum class Tag : std::uint8_t
{
    Direct         = 1,
    Bundle         = 2,
    SurveyResponse = 3,
};

const char *tag_name(Tag t);
bool        tag_from_u8(std::uint8_t v, Tag &out);

// On-wire fragment header
struct Header
{
    std::uint8_t  ver{PROTO_VER};  // 1B
    Tag           tag{Tag::Direct};  // 1B
    std::uint16_t index{0};        // 2B
    std::uint16_t total{0};        // 2B
    std::uint16_t len{0};          // 2B
};

struct Fragment
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;
};

// TX
// N = ceil(len / capacity), or 1 for an empty payload. Empty result when
// capacity is 0 or N would not fit the 16-bit count.
std::vector<Fragment>     split(const std::vector<std::uint8_t> &payload,
                                std::size_t                      capacity,
                                Tag                              tag);
std::vector<std::uint8_t> serialize(const Fragment &f);
bool                      pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
std::string               to_code(const Fragment &f);
// RX
std::optional<Fragment>   parse(const std::vector<std::uint8_t> &frame);
bool                      unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);
std::optional<Fragment>   parse_code(std::string_view code);

}  // namespace frag

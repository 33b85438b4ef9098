#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "proto/frag.hpp"
#include "proto/payload.hpp"
#include "util/clock.hpp"

namespace frag
{

enum class IngestResult
{
    Accepted,
    Duplicate,      // index already filled, state untouched
    Rejected,       // tag or total disagrees with the transfer in progress
    WindowExpired,  // the transfer's code window has closed
    Invalid,        // undecodable capture
};

enum class FinalizeStatus
{
    Ok,
    Incomplete,
    DecodeFailure,  // full coverage but the bytes do not decode
};

const char *to_string(IngestResult r);
const char *to_string(FinalizeStatus s);

// Receiver-side accumulator for one transfer. All members are safe to call
// from several threads; each ingest is applied as one unit and readers work
// on a consistent snapshot.
class Assembler
{
  public:
    explicit Assembler(const util::Clock &clock) : clock_(clock) {}

    IngestResult ingest(Tag tag, std::uint16_t index, std::uint16_t total,
                        std::vector<std::uint8_t> bytes);
    IngestResult ingest(const Fragment &f);
    // Decodes optical-code text first; garbled captures are dropped
    IngestResult ingest_code(std::string_view code);

    // distinct indices received / total, 0 before the first fragment
    double                     progress() const;
    std::size_t                received() const;
    std::size_t                total() const;
    std::optional<Tag>         tag() const;
    bool                       is_complete() const;
    std::vector<std::uint16_t> missing() const;
    bool                       window_expired() const;

    FinalizeStatus finalize(payload::LogicalPayload &out) const;

    // Bytes of the longest received run 0..k
    std::vector<std::uint8_t>             contiguous_prefix() const;
    std::optional<payload::PartialPayload> partial_reconstruct() const;

    // Drops the slices of a completed transfer. Tag and total stay behind so
    // codes that keep cycling past the camera count as duplicates.
    void retire();
    void reset();

  private:
    struct State
    {
        std::uint16_t                          total    = 0;  // 0 => no transfer yet
        Tag                                    tag      = Tag::Direct;
        std::size_t                            received = 0;
        std::size_t                            bytes    = 0;
        std::size_t                            run      = 0;  // contiguous indices from 0
        std::vector<std::vector<std::uint8_t>> parts;         // size == total
        std::vector<bool>                      have;          // size == total
        // TransferWindow, learned once its field shows up in the prefix
        bool                        window_known   = false;
        std::optional<std::int64_t> window_deadline;
        bool                        window_expired = false;
        bool                        retired        = false;  // completed, slices dropped
    };

    std::vector<std::uint8_t> prefix_locked() const;
    void                      learn_window_locked();
    bool                      window_passed_locked(util::TimePoint now) const;
    void                      wipe_parts_locked();

    const util::Clock &clock_;
    mutable std::mutex mu_;
    State              st_;
};

}  // namespace frag

#include <utility>

#include "crypto/sodium_util.hpp"
#include "proto/assembler.hpp"
#include "util/log.hpp"

namespace frag
{

const char *to_string(IngestResult r)
{
    switch (r)
    {
        case IngestResult::Accepted:
            return "accepted";
        case IngestResult::Duplicate:
            return "duplicate";
        case IngestResult::Rejected:
            return "rejected";
        case IngestResult::WindowExpired:
            return "window expired";
        case IngestResult::Invalid:
            return "invalid";
    }
    return "?";
}

const char *to_string(FinalizeStatus s)
{
    switch (s)
    {
        case FinalizeStatus::Ok:
            return "ok";
        case FinalizeStatus::Incomplete:
            return "incomplete";
        case FinalizeStatus::DecodeFailure:
            return "decode failure";
    }
    return "?";
}

IngestResult Assembler::ingest(Tag tag, std::uint16_t index, std::uint16_t total,
                               std::vector<std::uint8_t> bytes)
{
    Tag checked{};
    if (total == 0 || index >= total || !tag_from_u8(static_cast<std::uint8_t>(tag), checked))
    {
        LOG_DEBUG("Assembler::ingest: invalid fragment (index=%u, total=%u)", index, total);
        return IngestResult::Invalid;
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (st_.total == 0)
    {
        // first fragment of a new transfer is authoritative
        st_.total    = total;
        st_.tag      = tag;
        st_.received = 0;
        st_.bytes    = 0;
        st_.run      = 0;
        st_.parts.assign(total, {});
        st_.have.assign(total, false);
        LOG_DEBUG("Assembler::ingest: new %s transfer, %u fragments", tag_name(tag), total);
    }
    else if (st_.total != total || st_.tag != tag)
    {
        LOG_DEBUG("Assembler::ingest: rejected fragment (%s %u/%u) against %s transfer of %u",
                  tag_name(tag), index, total, tag_name(st_.tag), st_.total);
        return IngestResult::Rejected;
    }

    if (st_.retired)
        return IngestResult::Duplicate;

    const auto now = clock_.now();
    if (st_.window_expired || window_passed_locked(now))
    {
        st_.window_expired = true;
        LOG_DEBUG("Assembler::ingest: transfer window closed, dropping index %u", index);
        return IngestResult::WindowExpired;
    }

    if (st_.have[index])
    {
        LOG_DEBUG("Assembler::ingest: duplicate fragment (index=%u)", index);
        return IngestResult::Duplicate;
    }

    const std::size_t len     = bytes.size();
    const std::size_t run_was = st_.run;
    st_.bytes += len;
    st_.parts[index] = std::move(bytes);
    st_.have[index]  = true;
    st_.received++;
    while (st_.run < st_.total && st_.have[st_.run])
        st_.run++;

    if (st_.window_known || st_.run == run_was)
        return IngestResult::Accepted;

    learn_window_locked();
    if (window_passed_locked(now))
    {
        // this fragment revealed a deadline that had already gone by
        crypto::wipe(st_.parts[index]);
        st_.have[index] = false;
        st_.bytes -= len;
        st_.received--;
        st_.run            = run_was;
        st_.window_expired = true;
        LOG_DEBUG("Assembler::ingest: transfer window already closed, dropping index %u", index);
        return IngestResult::WindowExpired;
    }
    return IngestResult::Accepted;
}

IngestResult Assembler::ingest(const Fragment &f)
{
    if (f.hdr.len != f.payload.size())
        return IngestResult::Invalid;
    return ingest(f.hdr.tag, f.hdr.index, f.hdr.total, f.payload);
}

IngestResult Assembler::ingest_code(std::string_view code)
{
    auto f = parse_code(code);
    if (!f)
        return IngestResult::Invalid;
    return ingest(f->hdr.tag, f->hdr.index, f->hdr.total, std::move(f->payload));
}

bool Assembler::window_passed_locked(util::TimePoint now) const
{
    return st_.window_deadline && now > util::from_unix_seconds(*st_.window_deadline);
}

void Assembler::learn_window_locked()
{
    if (st_.run == 0)
        return;
    const auto prefix = prefix_locked();
    const auto p      = payload::decode_partial(prefix.data(), prefix.size());
    if (!p)
        return;
    if (p->window_deadline)
    {
        st_.window_known    = true;
        st_.window_deadline = p->window_deadline;
        LOG_DEBUG("Assembler: transfer window ends at %lld", (long long)*p->window_deadline);
        return;
    }
    // fields are ordered, anything past the window slot means there is none
    if (p->last_type > payload::T_WINDOW || (p->pending && p->pending->type > payload::T_WINDOW))
        st_.window_known = true;
}

double Assembler::progress() const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (st_.total == 0)
        return 0.0;
    return static_cast<double>(st_.received) / static_cast<double>(st_.total);
}

std::size_t Assembler::received() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return st_.received;
}

std::size_t Assembler::total() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return st_.total;
}

std::optional<Tag> Assembler::tag() const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (st_.total == 0)
        return std::nullopt;
    return st_.tag;
}

bool Assembler::is_complete() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return st_.total != 0 && st_.received == st_.total;
}

std::vector<std::uint16_t> Assembler::missing() const
{
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::uint16_t>  out;
    if (st_.retired)
        return out;
    for (std::uint16_t i = 0; i < st_.total; i++)
    {
        if (!st_.have[i])
            out.push_back(i);
    }
    return out;
}

bool Assembler::window_expired() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return st_.window_expired;
}

FinalizeStatus Assembler::finalize(payload::LogicalPayload &out) const
{
    std::vector<std::uint8_t> whole;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (st_.total == 0 || st_.retired || st_.received < st_.total)
            return FinalizeStatus::Incomplete;
        whole.reserve(st_.bytes);
        for (const auto &part : st_.parts)
            whole.insert(whole.end(), part.begin(), part.end());
    }

    const auto rc = payload::decode(whole, out);
    if (rc != payload::DecodeStatus::Ok)
    {
        LOG_WARN("Assembler::finalize: %zu bytes failed to decode (%s)", whole.size(),
                 payload::to_string(rc));
        return FinalizeStatus::DecodeFailure;
    }
    return FinalizeStatus::Ok;
}

std::vector<std::uint8_t> Assembler::prefix_locked() const
{
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i < st_.run; i++)
        out.insert(out.end(), st_.parts[i].begin(), st_.parts[i].end());
    return out;
}

std::vector<std::uint8_t> Assembler::contiguous_prefix() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return prefix_locked();
}

std::optional<payload::PartialPayload> Assembler::partial_reconstruct() const
{
    const auto prefix = contiguous_prefix();
    if (prefix.empty())
        return std::nullopt;
    return payload::decode_partial(prefix.data(), prefix.size());
}

void Assembler::wipe_parts_locked()
{
    for (auto &part : st_.parts)
        crypto::wipe(part);
}

void Assembler::retire()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (st_.total == 0 || st_.retired)
        return;
    wipe_parts_locked();
    st_.parts.clear();
    st_.have.clear();
    st_.bytes   = 0;
    st_.run     = 0;
    st_.retired = true;
    LOG_DEBUG("Assembler: %s transfer of %u retired", tag_name(st_.tag), st_.total);
}

void Assembler::reset()
{
    std::lock_guard<std::mutex> lock(mu_);
    wipe_parts_locked();
    st_ = State{};
}

}  // namespace frag

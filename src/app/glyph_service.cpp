#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "app/glyph_service.hpp"
#include "proto/assembler.hpp"
#include "proto/frag.hpp"
#include "proto/payload.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

static constexpr std::chrono::milliseconds TICK{100};

ServiceConfig config_from_env()
{
    ServiceConfig cfg;
    cfg.capacity = constants::env_in_range("GLYPH_CAPACITY", constants::MIN_CAPACITY,
                                           frag::MAX_SLICE, constants::DEFAULT_CAPACITY);
    cfg.cadence  = std::chrono::milliseconds(
        constants::env_in_range("GLYPH_CADENCE_MS", 20, 5000, constants::DEFAULT_CADENCE_MS));
    cfg.grace    = std::chrono::milliseconds(
        constants::env_in_range("GLYPH_GRACE_MS", 0, 60000, constants::DEFAULT_GRACE_MS));
    cfg.drop_every =
        static_cast<unsigned>(constants::env_in_range("GLYPH_DROP_EVERY", 0, 1000, 0));
    return cfg;
}

GlyphService::GlyphService(transport::ITransport &t,
                           const util::Clock     &clock,
                           store::IMessageStore  &messages,
                           store::IContactBook   &contacts,
                           ServiceConfig          cfg)
    : tx_(t),
      clock_(clock),
      messages_(messages),
      contacts_(contacts),
      cfg_(cfg),
      rx_(clock),
      cycler_(t)
{
}

bool GlyphService::start()
{
    // in case there is a previous link or worker
    stop();

    transport::Settings s{};
    s.role       = tx_.name() == "loopback" ? "loopback" : "camera";
    s.drop_every = cfg_.drop_every;

    if (!tx_.start(s, [this](const transport::Code &c) { this->on_capture(c); }))
        return false;

    {
        std::lock_guard<std::mutex> lock(q_mu_);
        worker_stop_ = false;
    }
    // consumer side of the capture queue; producers are whatever thread the
    // transport delivers on
    worker_ = std::thread([this] {
        while (true)
        {
            transport::Code code;
            {
                std::unique_lock<std::mutex> lock(q_mu_);
                q_cv_.wait(lock, [this] { return worker_stop_ || !queue_.empty(); });
                if (worker_stop_)
                    return;
                code = std::move(queue_.front());
                queue_.pop_front();
            }
            ingest(code);
        }
    });
    return true;
}

void GlyphService::stop()
{
    cycler_.stop();
    tx_.stop();
    {
        std::lock_guard<std::mutex> lock(q_mu_);
        worker_stop_ = true;
        queue_.clear();
    }
    q_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    stop_ticker();
}

bool GlyphService::send(const payload::LogicalPayload &p, frag::Tag tag)
{
    // 1) Serialize
    std::vector<std::uint8_t> bytes;
    if (!payload::encode(p, bytes))
    {
        LOG_ERROR("send: payload encode failed");
        return false;
    }

    // 2) Split
    const auto fragments = frag::split(bytes, cfg_.capacity, tag);
    if (fragments.empty())
    {
        LOG_ERROR("send: split failed");
        return false;
    }

    // 3) Render each fragment as code text
    std::vector<transport::Code> codes;
    codes.reserve(fragments.size());
    for (const auto &f : fragments)
    {
        auto code = frag::to_code(f);
        if (code.empty())
        {
            LOG_ERROR("send: fragment %u/%u could not be rendered", f.hdr.index + 1u,
                      static_cast<unsigned>(f.hdr.total));
            return false;
        }
        codes.push_back(std::move(code));
    }

    // 4) Cycle
    if (!cycler_.start(std::move(codes), cfg_.cadence))
        return false;
    LOG_SYSTEM("[SEND] cycling %zu code(s), %zu bytes, %s", fragments.size(), bytes.size(),
               payload::describe(p.expiry).c_str());
    return true;
}

void GlyphService::stop_sending()
{
    if (cycler_.running())
        LOG_SYSTEM("[SEND] stopped after %zu full cycle(s)", cycler_.rounds());
    cycler_.stop();
}

void GlyphService::on_capture(const transport::Code &code)
{
    {
        std::lock_guard<std::mutex> lock(q_mu_);
        if (worker_stop_)
            return;
        queue_.push_back(code);
    }
    q_cv_.notify_one();
}

frag::IngestResult GlyphService::scan(const transport::Code &code)
{
    const auto r = rx_.ingest_code(code);
    switch (r)
    {
        case frag::IngestResult::Accepted:
            LOG_DEBUG("[RECV] fragment accepted, %zu/%zu", rx_.received(), rx_.total());
            if (rx_.is_complete())
                on_complete();
            break;
        case frag::IngestResult::WindowExpired:
            if (!window_logged_.exchange(true))
                LOG_SYSTEM("[RECV] transfer window expired; this code can no longer be scanned");
            break;
        case frag::IngestResult::Duplicate:
        case frag::IngestResult::Rejected:
        case frag::IngestResult::Invalid:
            break;
    }
    return r;
}

void GlyphService::ingest(const transport::Code &code)
{
    (void)scan(code);
}

void GlyphService::on_complete()
{
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        if (completed_)
            return;
        completed_ = true;
    }

    payload::LogicalPayload p;
    const auto              rc = rx_.finalize(p);
    if (rc != frag::FinalizeStatus::Ok)
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        corrupted_ = true;
        LOG_SYSTEM("[RECV] transfer corrupted (%s); reset and scan again", frag::to_string(rc));
        view_cv_.notify_all();
        return;
    }
    // the lifecycle owns the only copy from here on
    rx_.retire();

    if (p.signature)
    {
        const bool is_new =
            contacts_.add_or_update(*p.signature, util::to_unix_seconds(clock_.now()));
        LOG_SYSTEM("[RECV] signed by %s%s", p.signature->display_text().c_str(),
                   is_new ? " (new contact)" : "");
    }

    const auto tag   = rx_.tag();
    const auto total = rx_.total();
    auto       lc    = std::make_shared<Lifecycle>(std::move(p), clock_, &messages_, cfg_.grace);
    const auto s     = lc->state();
    if (s == State::WindowLocked)
    {
        LOG_SYSTEM("[VIEW] window expired before open; message locked");
    }
    else
    {
        LOG_SYSTEM("[RECV] assembled %s message from %zu fragment(s), %s",
                   tag ? frag::tag_name(*tag) : "?", total,
                   payload::describe(lc->directive()).c_str());
    }

    {
        std::lock_guard<std::mutex> lock(view_mu_);
        view_ = std::move(lc);
    }
    view_cv_.notify_all();
}

bool GlyphService::wait_assembled(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(view_mu_);
    return view_cv_.wait_for(lock, timeout, [this] { return view_ != nullptr || corrupted_; });
}

bool GlyphService::corrupted() const
{
    std::lock_guard<std::mutex> lock(view_mu_);
    return corrupted_;
}

std::optional<State> GlyphService::view_state()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return std::nullopt;
    return lc->state();
}

std::optional<double> GlyphService::remaining()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return std::nullopt;
    return lc->remaining();
}

std::optional<payload::LogicalPayload> GlyphService::content()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return std::nullopt;
    return lc->content();
}

std::optional<State> GlyphService::open()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
    {
        LOG_WARN("open: nothing assembled yet");
        return std::nullopt;
    }

    const State s = lc->open();
    switch (s)
    {
        case State::WindowLocked:
            LOG_SYSTEM("[VIEW] window expired before open; message locked");
            break;
        case State::CountingDown:
            LOG_SYSTEM("[VIEW] opened, self-destructs in %s",
                       payload::describe(lc->directive()).c_str());
            start_ticker();
            break;
        case State::OpenReadOnce:
            LOG_SYSTEM("[VIEW] opened, vanishes when dismissed");
            break;
        case State::OpenPermanent:
            LOG_SYSTEM("[VIEW] opened, kept permanently");
            if (lc->saved())
                LOG_SYSTEM("[STORE] permanent message saved");
            break;
        default:
            LOG_DEBUG("open: no transition from %s", to_string(s));
            break;
    }
    return s;
}

std::optional<State> GlyphService::dismiss()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return std::nullopt;

    const State before = lc->state();
    const State s      = lc->dismiss();
    if (s == State::Vanishing && before != State::Vanishing)
    {
        LOG_SYSTEM("[VIEW] dismissed, message vanishing");
        start_ticker();
    }
    else if (s == State::OpenPermanent)
    {
        LOG_SYSTEM("[VIEW] dismissed, permanent message kept");
    }
    return s;
}

bool GlyphService::save()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return false;
    if (!lc->save())
    {
        LOG_WARN("save: message is not open");
        return false;
    }
    LOG_SYSTEM("[STORE] message saved");
    return true;
}

void GlyphService::close_view()
{
    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return;
    lc->cancel();
    stop_ticker();
    LOG_SYSTEM("[VIEW] closed (%s)", to_string(lc->state()));
}

void GlyphService::reset()
{
    close_view();
    {
        std::lock_guard<std::mutex> lock(q_mu_);
        queue_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        view_.reset();
        completed_ = false;
        corrupted_ = false;
    }
    window_logged_.store(false);
    rx_.reset();
    LOG_INFO("reset: ready for a new transfer");
}

void GlyphService::start_ticker()
{
    stop_ticker();

    std::shared_ptr<Lifecycle> lc;
    {
        std::lock_guard<std::mutex> lock(view_mu_);
        lc = view_;
    }
    if (!lc)
        return;

    ticker_stop_.store(false);
    ticker_ = std::thread([this, lc] {
        State last = lc->state();
        while (!ticker_stop_.load())
        {
            const State s = lc->state();
            if (s != last)
            {
                if (s == State::Destroyed)
                    LOG_SYSTEM("[VIEW] message destroyed");
                else
                    LOG_SYSTEM("[VIEW] %s -> %s", to_string(last), to_string(s));
                last = s;
            }
            if (is_terminal(s) || lc->cancelled())
                break;

            std::unique_lock<std::mutex> lock(tick_mu_);
            tick_cv_.wait_for(lock, TICK, [this] { return ticker_stop_.load(); });
        }
    });
}

void GlyphService::stop_ticker()
{
    {
        std::lock_guard<std::mutex> lock(tick_mu_);
        ticker_stop_.store(true);
    }
    tick_cv_.notify_all();
    if (ticker_.joinable())
        ticker_.join();
}

void GlyphService::log_status()
{
    const auto received = rx_.received();
    const auto total    = rx_.total();
    const auto tag      = rx_.tag();
    LOG_SYSTEM("[STATUS] transfer %zu/%zu (%.1f%%) tag=%s missing=%zu sending=%s", received,
               total, rx_.progress() * 100.0, tag ? frag::tag_name(*tag) : "-",
               rx_.missing().size(), sending() ? "yes" : "no");

    if (auto p = rx_.partial_reconstruct(); p && !rx_.is_complete())
    {
        LOG_SYSTEM("[STATUS] partial: %zu byte prefix, text=%s image=%s pending=0x%02x",
                   p->prefix_len, p->text ? "yes" : "no", p->image ? "yes" : "no",
                   p->pending ? p->pending->type : 0);
    }

    if (corrupted())
    {
        LOG_SYSTEM("[STATUS] transfer corrupted");
        return;
    }
    const auto s = view_state();
    if (!s)
        return;
    if (const auto left = remaining())
        LOG_SYSTEM("[STATUS] view=%s remaining=%.1fs", to_string(*s), *left);
    else
        LOG_SYSTEM("[STATUS] view=%s", to_string(*s));
}

}  // namespace app

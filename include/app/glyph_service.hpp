#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "app/cycler.hpp"
#include "app/lifecycle.hpp"
#include "proto/assembler.hpp"
#include "proto/frag.hpp"
#include "proto/payload.hpp"
#include "store/store.hpp"
#include "transport/itransport.hpp"
#include "util/clock.hpp"
#include "util/constants.hpp"

namespace app
{

struct ServiceConfig
{
    std::size_t               capacity   = constants::DEFAULT_CAPACITY;
    std::chrono::milliseconds cadence{constants::DEFAULT_CADENCE_MS};
    std::chrono::milliseconds grace{constants::DEFAULT_GRACE_MS};
    unsigned                  drop_every = 0;  // loopback camera misses
};

// GLYPH_CAPACITY, GLYPH_CADENCE_MS, GLYPH_GRACE_MS and GLYPH_DROP_EVERY
ServiceConfig config_from_env();

// One device's side of the optical link: shows outgoing payloads as a cycle
// of codes and reassembles incoming ones into a viewable message.
class GlyphService
{
  public:
    GlyphService(transport::ITransport &t,
                 const util::Clock     &clock,
                 store::IMessageStore  &messages,
                 store::IContactBook   &contacts,
                 ServiceConfig          cfg = {});
    ~GlyphService() { stop(); }

    bool start();
    void stop();

    // --- sender ---
    bool send(const payload::LogicalPayload &p, frag::Tag tag = frag::Tag::Direct);
    void stop_sending();
    bool sending() const { return cycler_.running(); }

    // --- receiver ---
    // Capture callback: queues the code for the ingestion worker
    void               on_capture(const transport::Code &code);
    // Ingests on the calling thread
    frag::IngestResult scan(const transport::Code &code);
    // Blocks until the current transfer produced a message or failed to decode
    bool               wait_assembled(std::chrono::milliseconds timeout);

    double                                 progress() const { return rx_.progress(); }
    std::optional<payload::PartialPayload> partial() const { return rx_.partial_reconstruct(); }
    bool                                   corrupted() const;

    std::optional<State>                   view_state();
    std::optional<double>                  remaining();
    std::optional<payload::LogicalPayload> content();
    std::optional<State>                   open();
    std::optional<State>                   dismiss();
    bool                                   save();
    // Viewer closed: cancels any pending destruction, no side effects
    void                                   close_view();
    // Drops the transfer and the view, ready for a different source
    void                                   reset();

    void log_status();

  private:
    void ingest(const transport::Code &code);
    void on_complete();
    void start_ticker();
    void stop_ticker();

    transport::ITransport &tx_;
    const util::Clock     &clock_;
    store::IMessageStore  &messages_;
    store::IContactBook   &contacts_;
    ServiceConfig          cfg_;
    frag::Assembler        rx_;
    Cycler                 cycler_;

    // ingestion queue (capture thread -> worker)
    std::mutex                    q_mu_;
    std::condition_variable       q_cv_;
    std::deque<transport::Code>   queue_;
    std::thread                   worker_;
    bool                          worker_stop_{true};

    // view of the reconstructed message
    mutable std::mutex            view_mu_;
    std::condition_variable       view_cv_;
    std::shared_ptr<Lifecycle>    view_;
    bool                          completed_{false};
    bool                          corrupted_{false};
    std::atomic_bool              window_logged_{false};

    // countdown ticker
    std::thread             ticker_;
    std::atomic_bool        ticker_stop_{true};
    std::mutex              tick_mu_;
    std::condition_variable tick_cv_;
};

}  // namespace app

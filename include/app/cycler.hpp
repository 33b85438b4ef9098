#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

#include "transport/itransport.hpp"

namespace app
{

// Presents codes 0, 1, ..., N-1, 0, 1, ... on the display at a fixed cadence
// until stopped.
class Cycler
{
  public:
    explicit Cycler(transport::ITransport &t) : tx_(t) {}
    ~Cycler() { stop(); }

    Cycler(const Cycler &)            = delete;
    Cycler &operator=(const Cycler &) = delete;

    bool        start(std::vector<transport::Code> codes, std::chrono::milliseconds cadence);
    void        stop();
    bool        running() const { return !stop_.load(); }
    std::size_t rounds() const { return rounds_.load(); }

  private:
    transport::ITransport     &tx_;
    std::thread                thr_;
    std::atomic_bool           stop_{true};
    std::atomic<std::size_t>   rounds_{0};
    std::mutex                 mu_;
    std::condition_variable    cv_;
};

}  // namespace app

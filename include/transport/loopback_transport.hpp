#pragma once
#include <cstddef>
#include <mutex>

#include "transport/itransport.hpp"

namespace transport
{

class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnCode on_capture) override;
    bool        present(const Code &one_code) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

    std::size_t presented() const;
    std::size_t dropped() const;

  private:
    mutable std::mutex mu_;
    OnCode             on_capture_{};
    std::size_t        max_len_{0};
    unsigned           drop_every_{0};
    std::size_t        presented_{0};
    std::size_t        dropped_{0};
    bool               started_{false};
};

}  // namespace transport

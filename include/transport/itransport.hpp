#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace transport
{

// Text carried by one optical code, as rendered and as decoded by the camera
using Code   = std::string;
using OnCode = std::function<void(const Code &)>;

struct Settings
{
    std::string role;                  // "display", "camera" (or "loopback" for testing)
    std::size_t max_code_len = 4096;   // longest text one code may carry
    unsigned    drop_every   = 0;      // loopback only: miss every Nth code, 0 = never
};

// Optical link. The display side presents one code at a time; the capture
// side reports decoded code text in whatever order and multiplicity the
// camera produced it.
struct ITransport
{
    virtual bool        start(const Settings &s, OnCode on_capture) = 0;
    virtual bool        present(const Code &one_code)               = 0;
    virtual void        stop()                                      = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport()                  = default;
};

}  // namespace transport

#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>

namespace util
{

// Wall clock. Countdowns are measured against it (not a tick counter) so they
// stay correct across process suspension.
using TimePoint = std::chrono::system_clock::time_point;

struct Clock
{
    virtual TimePoint now() const = 0;
    virtual ~Clock()              = default;
};

class SystemClock final : public Clock
{
  public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to.
class ManualClock final : public Clock
{
  public:
    explicit ManualClock(TimePoint start = TimePoint{std::chrono::seconds(1'700'000'000)})
        : now_(start)
    {
    }

    TimePoint now() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return now_;
    }

    template <class Rep, class Period>
    void advance(std::chrono::duration<Rep, Period> d)
    {
        std::lock_guard<std::mutex> lock(mu_);
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
    }

    void set(TimePoint t)
    {
        std::lock_guard<std::mutex> lock(mu_);
        now_ = t;
    }

  private:
    mutable std::mutex mu_;
    TimePoint          now_;
};

inline std::int64_t to_unix_seconds(TimePoint t)
{
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

inline TimePoint from_unix_seconds(std::int64_t s)
{
    return TimePoint{std::chrono::seconds(s)};
}

}  // namespace util

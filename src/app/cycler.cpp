#include <utility>

#include "app/cycler.hpp"
#include "util/log.hpp"

namespace app
{

bool Cycler::start(std::vector<transport::Code> codes, std::chrono::milliseconds cadence)
{
    // in case a previous cycle is still on screen
    stop();
    if (codes.empty())
    {
        LOG_ERROR("Cycler::start: nothing to present");
        return false;
    }
    if (cadence < std::chrono::milliseconds(1))
        cadence = std::chrono::milliseconds(1);

    rounds_.store(0);
    stop_.store(false);
    thr_ = std::thread([this, codes = std::move(codes), cadence] {
        std::size_t i = 0;
        while (!stop_.load())
        {
            if (!tx_.present(codes[i]))
                LOG_WARN("Cycler: present failed for code %zu/%zu", i + 1, codes.size());

            if (++i == codes.size())
            {
                i = 0;
                rounds_.fetch_add(1);
            }

            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait_for(lock, cadence, [this] { return stop_.load(); });
        }
    });
    return true;
}

void Cycler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_.store(true);
    }
    cv_.notify_all();
    if (thr_.joinable())
        thr_.join();
}

}  // namespace app

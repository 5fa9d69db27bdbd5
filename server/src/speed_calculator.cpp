#include "chunkdrive/server/speed_calculator.hpp"

#include <algorithm>

namespace chunkdrive::server
{

    SpeedCalculator::SpeedCalculator(std::size_t window) : window_(std::max<std::size_t>(window, 2)) {}

    void SpeedCalculator::add_sample(std::uint64_t cumulative_bytes, Clock::time_point timestamp)
    {
        samples_.push_back(Sample{timestamp, cumulative_bytes});
        while (samples_.size() > window_)
        {
            samples_.pop_front();
        }
    }

    double SpeedCalculator::calculate_speed() const
    {
        if (samples_.size() < 2)
        {
            return 0.0;
        }
        const auto &oldest = samples_.front();
        const auto &newest = samples_.back();
        const auto elapsed = std::chrono::duration<double>(newest.time - oldest.time).count();
        if (elapsed <= 0.0 || newest.bytes < oldest.bytes)
        {
            return 0.0;
        }
        return static_cast<double>(newest.bytes - oldest.bytes) / elapsed;
    }

    std::optional<double> SpeedCalculator::calculate_eta(std::uint64_t remaining_bytes) const
    {
        const auto speed = calculate_speed();
        if (speed <= 0.0)
        {
            return std::nullopt;
        }
        return static_cast<double>(remaining_bytes) / speed;
    }

    void SpeedCalculator::reset()
    {
        samples_.clear();
    }

} // namespace chunkdrive::server

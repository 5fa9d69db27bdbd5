#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace chunkdrive::server
{

    // Throughput over the last `window` (timestamp, cumulative bytes) samples.
    class SpeedCalculator
    {
    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::size_t kDefaultWindow = 10;

        explicit SpeedCalculator(std::size_t window = kDefaultWindow);

        void add_sample(std::uint64_t cumulative_bytes, Clock::time_point timestamp = Clock::now());

        // Bytes per second; 0.0 with fewer than two samples or no elapsed time.
        double calculate_speed() const;

        // Seconds until completion, or nullopt while the speed is zero.
        std::optional<double> calculate_eta(std::uint64_t remaining_bytes) const;

        void reset();

        std::size_t sample_count() const noexcept { return samples_.size(); }

    private:
        struct Sample
        {
            Clock::time_point time;
            std::uint64_t bytes;
        };

        std::size_t window_;
        std::deque<Sample> samples_;
    };

} // namespace chunkdrive::server

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "chunkdrive/transfer_types.hpp"

namespace chunkdrive::server
{

    // Bounded event queue drained by one background thread. Producers never
    // block: when the queue is full the event is dropped. A listener that throws
    // is logged and does not affect delivery to the others.
    class EventDispatcher
    {
    public:
        using Listener = std::function<void(const TransferEvent &)>;
        using ListenerId = std::uint64_t;

        static constexpr std::size_t kDefaultCapacity = 1024;

        explicit EventDispatcher(std::size_t capacity = kDefaultCapacity);
        ~EventDispatcher();

        EventDispatcher(const EventDispatcher &) = delete;
        EventDispatcher &operator=(const EventDispatcher &) = delete;

        ListenerId subscribe(Listener listener);
        bool unsubscribe(ListenerId id);

        // Returns false when the event was dropped.
        bool publish(TransferEvent event);

        // Blocks until every event queued so far has been delivered.
        void flush();

        // Delivers what is queued, then joins the consumer. Later publishes are dropped.
        void stop();

        std::uint64_t delivered_count() const noexcept { return delivered_.load(); }
        std::uint64_t dropped_count() const noexcept { return dropped_.load(); }

    private:
        void run();
        void deliver(const TransferEvent &event);

        const std::size_t capacity_;

        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::condition_variable idle_cv_;
        std::deque<TransferEvent> queue_;
        bool stopping_{false};
        bool busy_{false};

        std::mutex listeners_mutex_;
        ListenerId next_listener_id_{1};
        std::vector<std::pair<ListenerId, std::shared_ptr<Listener>>> listeners_;

        std::atomic<std::uint64_t> delivered_{0};
        std::atomic<std::uint64_t> dropped_{0};

        std::thread worker_;
    };

} // namespace chunkdrive::server

#include "chunkdrive/server/event_dispatcher.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    EventDispatcher::EventDispatcher(std::size_t capacity)
        : capacity_(std::max<std::size_t>(capacity, 1)),
          worker_([this]
                  { run(); })
    {
    }

    EventDispatcher::~EventDispatcher()
    {
        stop();
    }

    EventDispatcher::ListenerId EventDispatcher::subscribe(Listener listener)
    {
        std::lock_guard lock(listeners_mutex_);
        const auto id = next_listener_id_++;
        listeners_.emplace_back(id, std::make_shared<Listener>(std::move(listener)));
        return id;
    }

    bool EventDispatcher::unsubscribe(ListenerId id)
    {
        std::lock_guard lock(listeners_mutex_);
        auto it = std::find_if(listeners_.begin(), listeners_.end(), [id](const auto &entry)
                               { return entry.first == id; });
        if (it == listeners_.end())
        {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    bool EventDispatcher::publish(TransferEvent event)
    {
        {
            std::lock_guard lock(queue_mutex_);
            if (stopping_ || queue_.size() >= capacity_)
            {
                ++dropped_;
                spdlog::debug("Dropping {} event for transfer {}", to_string(event.type), event.snapshot.transfer_id);
                return false;
            }
            queue_.push_back(std::move(event));
        }
        queue_cv_.notify_one();
        return true;
    }

    void EventDispatcher::flush()
    {
        std::unique_lock lock(queue_mutex_);
        idle_cv_.wait(lock, [this]
                      { return queue_.empty() && !busy_; });
    }

    void EventDispatcher::stop()
    {
        {
            std::lock_guard lock(queue_mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        {
            worker_.join();
        }
    }

    void EventDispatcher::run()
    {
        std::unique_lock lock(queue_mutex_);
        while (true)
        {
            queue_cv_.wait(lock, [this]
                           { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
            {
                break;
            }
            auto event = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
            lock.unlock();

            deliver(event);

            lock.lock();
            busy_ = false;
            if (queue_.empty())
            {
                idle_cv_.notify_all();
            }
        }
        idle_cv_.notify_all();
    }

    void EventDispatcher::deliver(const TransferEvent &event)
    {
        std::vector<std::shared_ptr<Listener>> listeners;
        {
            std::lock_guard lock(listeners_mutex_);
            listeners.reserve(listeners_.size());
            for (const auto &entry : listeners_)
            {
                listeners.push_back(entry.second);
            }
        }

        for (const auto &listener : listeners)
        {
            try
            {
                (*listener)(event);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Event listener failed on {} for transfer {}: {}", to_string(event.type),
                             event.snapshot.transfer_id, ex.what());
            }
            catch (...)
            {
                spdlog::warn("Event listener failed on {} for transfer {}: unknown exception", to_string(event.type),
                             event.snapshot.transfer_id);
            }
        }
        ++delivered_;
    }

} // namespace chunkdrive::server

#include <convo/delivery/BroadcastRegistry.hpp>

#include <utility>
#include <vector>

#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    // ───────────────────────── Subscription ─────────────────────────

    Subscription::Subscription(std::weak_ptr<BroadcastRegistry> registry,
                               std::string conversationId,
                               std::uint64_t id,
                               std::size_t capacity,
                               Notify notify)
        : registry_(std::move(registry)),
          conversationId_(std::move(conversationId)),
          id_(id),
          capacity_(capacity == 0 ? 1 : capacity),
          notify_(std::move(notify))
    {
    }

    Subscription::~Subscription()
    {
        release();
    }

    std::optional<BroadcastEvent> Subscription::poll()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
            return std::nullopt;

        BroadcastEvent ev = std::move(queue_.front());
        queue_.pop_front();
        if (ev.kind == EventKind::Signal)
            --queuedSignals_;
        return ev;
    }

    std::size_t Subscription::pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool Subscription::overflowed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return overflowed_;
    }

    bool Subscription::deliver(const BroadcastEvent &event)
    {
        bool wake = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (released_.load() || overflowed_)
                return false;

            if (event.kind == EventKind::Signal)
            {
                if (queuedSignals_ >= capacity_)
                    return false;

                wake = queue_.empty();
                queue_.push_back(event);
                ++queuedSignals_;
            }
            else if (queue_.size() - queuedSignals_ >= capacity_)
            {
                overflowed_ = true;
                queue_.clear();
                queuedSignals_ = 0;
                wake = true;
            }
            else
            {
                wake = queue_.empty();
                queue_.push_back(event);
            }
        }

        if (wake && notify_)
            notify_();

        return !overflowed();
    }

    void Subscription::release()
    {
        if (released_.exchange(true))
            return;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.clear();
            queuedSignals_ = 0;
        }

        if (auto registry = registry_.lock())
            registry->unsubscribe(conversationId_, id_);
    }

    // ───────────────────────── BroadcastRegistry ─────────────────────────

    std::shared_ptr<BroadcastRegistry> BroadcastRegistry::create()
    {
        return std::shared_ptr<BroadcastRegistry>(new BroadcastRegistry());
    }

    std::shared_ptr<Subscription> BroadcastRegistry::subscribe(const std::string &conversation_id,
                                                               std::size_t capacity,
                                                               Subscription::Notify notify)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const std::uint64_t id = nextId_++;
        std::shared_ptr<Subscription> sub(
            new Subscription(weak_from_this(), conversation_id, id, capacity, std::move(notify)));

        conversations_[conversation_id].emplace(id, sub);

        logger.log(Logger::Level::DEBUG,
                   "[Delivery][Registry] subscribe conversation={} id={} capacity={}",
                   conversation_id, id, sub->capacity());
        return sub;
    }

    std::size_t BroadcastRegistry::publish(const std::string &conversation_id, const BroadcastEvent &event)
    {
        std::vector<std::shared_ptr<Subscription>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = conversations_.find(conversation_id);
            if (it == conversations_.end())
                return 0;

            targets.reserve(it->second.size());
            for (auto sit = it->second.begin(); sit != it->second.end();)
            {
                if (auto sub = sit->second.lock())
                {
                    targets.push_back(std::move(sub));
                    ++sit;
                }
                else
                {
                    sit = it->second.erase(sit);
                }
            }

            if (it->second.empty())
                conversations_.erase(it);
        }

        // Deliver outside the registry lock: notify callbacks may post work.
        std::size_t delivered = 0;
        for (const auto &sub : targets)
        {
            if (sub->deliver(event))
            {
                ++delivered;
            }
            else if (sub->overflowed())
            {
                logger.log(Logger::Level::WARN,
                           "[Delivery][Registry] subscription {} on {} overflowed (capacity {})",
                           sub->id(), conversation_id, sub->capacity());
            }
        }
        return delivered;
    }

    void BroadcastRegistry::unsubscribe(const std::string &conversation_id, std::uint64_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = conversations_.find(conversation_id);
        if (it == conversations_.end())
            return;

        it->second.erase(id);
        if (it->second.empty())
            conversations_.erase(it);

        logger.log(Logger::Level::DEBUG,
                   "[Delivery][Registry] unsubscribe conversation={} id={}", conversation_id, id);
    }

    std::size_t BroadcastRegistry::subscriber_count(const std::string &conversation_id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = conversations_.find(conversation_id);
        if (it == conversations_.end())
            return 0;

        std::size_t n = 0;
        for (const auto &[id, weak] : it->second)
        {
            if (!weak.expired())
                ++n;
        }
        return n;
    }

    std::size_t BroadcastRegistry::conversation_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return conversations_.size();
    }

} // namespace convo::delivery

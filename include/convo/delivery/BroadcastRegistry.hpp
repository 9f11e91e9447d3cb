#ifndef CONVO_DELIVERY_BROADCAST_REGISTRY_HPP
#define CONVO_DELIVERY_BROADCAST_REGISTRY_HPP

/**
 * @file BroadcastRegistry.hpp
 * @brief In-process fan-out of freshly appended events to live connections.
 *
 * The registry maps conversation id → live subscriptions. It only keeps
 * weak references: a Subscription handle is owned by its connection and
 * unregisters itself on release() or destruction.
 *
 * Delivery is best-effort and at-most-once per subscription. Each
 * subscription buffers at most `capacity` messages; one more marks it
 * overflowed and drops its backlog, and the owner is expected to disconnect
 * and let the client resync from the log. Signals have their own budget of
 * `capacity` and are simply dropped when it is full.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    class BroadcastRegistry;

    class Subscription
    {
    public:
        using Notify = std::function<void()>;

        ~Subscription();

        Subscription(const Subscription &) = delete;
        Subscription &operator=(const Subscription &) = delete;

        /// Next buffered event, oldest first.
        [[nodiscard]] std::optional<BroadcastEvent> poll();

        [[nodiscard]] std::size_t pending() const;
        [[nodiscard]] bool overflowed() const;
        [[nodiscard]] bool released() const noexcept { return released_.load(); }

        [[nodiscard]] const std::string &conversation_id() const noexcept { return conversationId_; }
        [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
        [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

        /// Leave the registry. Idempotent; buffered events are discarded.
        void release();

    private:
        friend class BroadcastRegistry;

        Subscription(std::weak_ptr<BroadcastRegistry> registry,
                     std::string conversationId,
                     std::uint64_t id,
                     std::size_t capacity,
                     Notify notify);

        /// Enqueue and, on an empty→non-empty or overflow transition, notify.
        /// Returns false when the event was not accepted.
        bool deliver(const BroadcastEvent &event);

        std::weak_ptr<BroadcastRegistry> registry_;
        std::string conversationId_;
        std::uint64_t id_;
        std::size_t capacity_;
        Notify notify_;

        mutable std::mutex mutex_;
        std::deque<BroadcastEvent> queue_;
        std::size_t queuedSignals_ = 0;
        bool overflowed_ = false;
        std::atomic<bool> released_{false};
    };

    class BroadcastRegistry : public std::enable_shared_from_this<BroadcastRegistry>
    {
    public:
        /// Registries are always shared: subscriptions keep a weak reference.
        [[nodiscard]] static std::shared_ptr<BroadcastRegistry> create();

        BroadcastRegistry(const BroadcastRegistry &) = delete;
        BroadcastRegistry &operator=(const BroadcastRegistry &) = delete;

        [[nodiscard]] std::shared_ptr<Subscription> subscribe(const std::string &conversation_id,
                                                              std::size_t capacity,
                                                              Subscription::Notify notify = {});

        /// Fan `event` out to this instance's subscribers of `conversation_id`.
        /// Returns the number of subscriptions that accepted it.
        std::size_t publish(const std::string &conversation_id, const BroadcastEvent &event);

        [[nodiscard]] std::size_t subscriber_count(const std::string &conversation_id) const;
        [[nodiscard]] std::size_t conversation_count() const;

    private:
        friend class Subscription;

        BroadcastRegistry() = default;

        void unsubscribe(const std::string &conversation_id, std::uint64_t id);

        mutable std::mutex mutex_;
        std::unordered_map<std::string,
                           std::unordered_map<std::uint64_t, std::weak_ptr<Subscription>>>
            conversations_;
        std::uint64_t nextId_ = 1;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_BROADCAST_REGISTRY_HPP

#ifndef CONVO_DELIVERY_MESSAGE_PUBLISHER_HPP
#define CONVO_DELIVERY_MESSAGE_PUBLISHER_HPP

/**
 * @file MessagePublisher.hpp
 * @brief Entry point for producers: append to the log, then fan out locally.
 *
 * A per-conversation lock (striped) is held across append and publish so
 * local subscribers always see one conversation's events in id order.
 * Appends to different conversations mostly proceed in parallel.
 */

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <convo/delivery/BroadcastRegistry.hpp>
#include <convo/delivery/ConversationLog.hpp>
#include <convo/delivery/Metrics.hpp>

namespace convo::delivery
{
    class MessagePublisher
    {
    public:
        MessagePublisher(std::shared_ptr<IConversationLog> log,
                         std::shared_ptr<BroadcastRegistry> registry,
                         DeliveryMetrics *metrics = nullptr);

        /// Durable publish. Throws StoreError when the append fails, in which
        /// case nothing was published.
        StreamEntryId publish(const std::string &conversation_id, const std::string &payload);

        /// Ephemeral signal: registry only, never logged.
        /// Returns the number of subscriptions that accepted it.
        std::size_t signal(const std::string &conversation_id,
                           const std::string &payload,
                           const std::string &origin_client_id);

    private:
        static constexpr std::size_t kStripes = 64;

        std::mutex &stripe_for(const std::string &conversation_id);

        std::shared_ptr<IConversationLog> log_;
        std::shared_ptr<BroadcastRegistry> registry_;
        DeliveryMetrics *metrics_;
        std::array<std::mutex, kStripes> stripes_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_MESSAGE_PUBLISHER_HPP

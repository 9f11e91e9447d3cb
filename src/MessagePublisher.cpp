#include <convo/delivery/MessagePublisher.hpp>

#include <functional>
#include <utility>

#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    MessagePublisher::MessagePublisher(std::shared_ptr<IConversationLog> log,
                                       std::shared_ptr<BroadcastRegistry> registry,
                                       DeliveryMetrics *metrics)
        : log_(std::move(log)), registry_(std::move(registry)), metrics_(metrics)
    {
    }

    std::mutex &MessagePublisher::stripe_for(const std::string &conversation_id)
    {
        return stripes_[std::hash<std::string>{}(conversation_id) % kStripes];
    }

    StreamEntryId MessagePublisher::publish(const std::string &conversation_id, const std::string &payload)
    {
        std::lock_guard<std::mutex> lock(stripe_for(conversation_id));

        BroadcastEvent ev;
        try
        {
            ev = log_->append_entry(conversation_id, payload);
        }
        catch (const StoreError &e)
        {
            if (metrics_)
                metrics_->publish_failures_total++;
            logger.log(Logger::Level::ERROR,
                       "[Delivery][Publisher] append to {} failed: {}", conversation_id, e.what());
            throw;
        }

        ev.kind = EventKind::Message;
        const StreamEntryId id = ev.stream_entry_id;

        const std::size_t delivered = registry_->publish(conversation_id, ev);

        if (metrics_)
            metrics_->publishes_total++;

        logger.log(Logger::Level::DEBUG,
                   "[Delivery][Publisher] {} {} -> {} local subscriber(s)",
                   conversation_id, id.to_string(), delivered);
        return id;
    }

    std::size_t MessagePublisher::signal(const std::string &conversation_id,
                                         const std::string &payload,
                                         const std::string &origin_client_id)
    {
        BroadcastEvent ev;
        ev.conversation_id = conversation_id;
        ev.payload = payload;
        ev.produced_at = SystemClock::now();
        ev.kind = EventKind::Signal;
        ev.origin_client_id = origin_client_id;

        return registry_->publish(conversation_id, ev);
    }

} // namespace convo::delivery

#ifndef CONVO_DELIVERY_CONTEXT_HPP
#define CONVO_DELIVERY_CONTEXT_HPP

#include <memory>

#include <boost/asio/any_io_executor.hpp>

#include <convo/delivery/AccessPolicy.hpp>
#include <convo/delivery/BroadcastRegistry.hpp>
#include <convo/delivery/ConversationLog.hpp>
#include <convo/delivery/MessagePublisher.hpp>
#include <convo/delivery/Metrics.hpp>
#include <convo/delivery/SyncStateStore.hpp>
#include <convo/delivery/config.hpp>

namespace convo::delivery
{
    /// Process-wide collaborators handed to every connection.
    struct DeliveryContext
    {
        Config config;
        std::shared_ptr<IConversationLog> log;
        std::shared_ptr<ISyncStateStore> syncStore;
        std::shared_ptr<BroadcastRegistry> registry;
        std::shared_ptr<MessagePublisher> publisher;
        std::shared_ptr<IAccessPolicy> accessPolicy;
        std::shared_ptr<DeliveryMetrics> metrics;

        /// Where blocking store calls run (a thread_pool in production).
        boost::asio::any_io_executor blockingExecutor;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_CONTEXT_HPP

#ifndef CONVO_DELIVERY_HPP
#define CONVO_DELIVERY_HPP

/**
 * @file delivery.hpp
 * @brief Umbrella header for the conversation delivery library.
 */

#include <convo/config/Config.hpp>
#include <convo/utils/Logger.hpp>

#include <convo/delivery/types.hpp>
#include <convo/delivery/config.hpp>
#include <convo/delivery/protocol.hpp>
#include <convo/delivery/Metrics.hpp>

#include <convo/delivery/ConversationLog.hpp>
#include <convo/delivery/MemoryConversationLog.hpp>
#include <convo/delivery/SqliteConversationLog.hpp>
#include <convo/delivery/SyncStateStore.hpp>
#include <convo/delivery/MemorySyncStateStore.hpp>
#include <convo/delivery/SqliteSyncStateStore.hpp>

#include <convo/delivery/BroadcastRegistry.hpp>
#include <convo/delivery/MessagePublisher.hpp>
#include <convo/delivery/AccessPolicy.hpp>
#include <convo/delivery/ConnectionSession.hpp>
#include <convo/delivery/RetentionSweeper.hpp>

#include <convo/delivery/server.hpp>
#include <convo/delivery/App.hpp>

#endif // CONVO_DELIVERY_HPP

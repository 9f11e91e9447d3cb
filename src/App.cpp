#include <convo/delivery/App.hpp>

#include <utility>

#include <convo/delivery/MemoryConversationLog.hpp>
#include <convo/delivery/MemorySyncStateStore.hpp>
#include <convo/delivery/SqliteConversationLog.hpp>
#include <convo/delivery/SqliteSyncStateStore.hpp>
#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr const char *kInMemory = ":memory:";

        std::shared_ptr<IConversationLog> open_log(const Config &cfg)
        {
            if (cfg.logPath == kInMemory)
            {
                logger.log(Logger::Level::WARN, "[Delivery][App] conversation log is in memory, nothing survives a restart");
                return std::make_shared<MemoryConversationLog>();
            }
            return std::make_shared<SqliteConversationLog>(cfg.logPath);
        }

        std::shared_ptr<ISyncStateStore> open_sync_store(const Config &cfg)
        {
            const auto ttl = std::chrono::duration_cast<std::chrono::seconds>(cfg.cursorTtl);
            if (cfg.cursorPath == kInMemory)
                return std::make_shared<MemorySyncStateStore>(ttl);
            return std::make_shared<SqliteSyncStateStore>(cfg.cursorPath, ttl);
        }

        Config load_and_apply(const convo::config::Config &core)
        {
            if (core.has("log.level"))
                Logger::getInstance().setLevel(core.getString("log.level", "info"));
            return Config::from_core(core);
        }
    } // namespace

    App::App(const std::string &configPath)
        : App(convo::config::Config{configPath})
    {
    }

    App::App(const convo::config::Config &core)
        : App(load_and_apply(core), nullptr, nullptr, nullptr)
    {
    }

    App::App(Config cfg,
             std::shared_ptr<IConversationLog> log,
             std::shared_ptr<ISyncStateStore> syncStore,
             std::shared_ptr<IAccessPolicy> policy)
        : pool_(cfg.storeThreads),
          ctx_(std::make_shared<DeliveryContext>())
    {
        ctx_->log = log ? std::move(log) : open_log(cfg);
        ctx_->syncStore = syncStore ? std::move(syncStore) : open_sync_store(cfg);
        ctx_->registry = BroadcastRegistry::create();
        ctx_->metrics = std::make_shared<DeliveryMetrics>();
        ctx_->publisher = std::make_shared<MessagePublisher>(ctx_->log, ctx_->registry, ctx_->metrics.get());
        ctx_->accessPolicy = policy ? std::move(policy) : std::make_shared<AllowAllPolicy>();
        ctx_->blockingExecutor = pool_.get_executor();
        ctx_->config = std::move(cfg);

        server_ = std::make_unique<Server>(ctx_);

        sweeper_ = std::make_shared<RetentionSweeper>(server_->io_context().get_executor(),
                                                      pool_.get_executor(),
                                                      ctx_->log,
                                                      ctx_->syncStore,
                                                      ctx_->config.logRetention,
                                                      ctx_->config.maintenanceInterval,
                                                      ctx_->metrics);
    }

    App::~App()
    {
        stop();
    }

    void App::start()
    {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (started_)
                return;
            started_ = true;
        }

        sweeper_->start();
        server_->run();

        logger.log(Logger::Level::INFO,
                   "[Delivery][App] ready on port {} ({} I/O threads, {} store threads)",
                   server_->port(), ctx_->config.ioThreads, ctx_->config.storeThreads);
    }

    void App::run_blocking()
    {
        start();

        std::unique_lock<std::mutex> lock(stateMutex_);
        stopped_.wait(lock, [this]
                      { return done_; });
    }

    void App::stop()
    {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (stopping_)
                return;
            stopping_ = true;
        }

        sweeper_->stop();
        server_->stop_async();
        server_->join_threads();

        // Final cursor writes are still queued on the pool.
        pool_.join();

        logger.log(Logger::Level::INFO, "[Delivery][App] stopped");

        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            done_ = true;
        }
        stopped_.notify_all();
    }

} // namespace convo::delivery

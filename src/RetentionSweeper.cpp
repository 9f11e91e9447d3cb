#include <convo/delivery/RetentionSweeper.hpp>

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    namespace net = boost::asio;
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    RetentionSweeper::RetentionSweeper(net::any_io_executor executor,
                                       net::any_io_executor blocking,
                                       std::shared_ptr<IConversationLog> log,
                                       std::shared_ptr<ISyncStateStore> syncStore,
                                       std::chrono::hours retention,
                                       std::chrono::seconds interval,
                                       std::shared_ptr<DeliveryMetrics> metrics,
                                       Clock clock)
        : timer_(std::move(executor)),
          blocking_(std::move(blocking)),
          log_(std::move(log)),
          syncStore_(std::move(syncStore)),
          retention_(retention),
          interval_(interval),
          metrics_(std::move(metrics)),
          clock_(clock ? std::move(clock) : Clock{[]
                                                  { return SystemClock::now(); }})
    {
    }

    void RetentionSweeper::start()
    {
        if (interval_.count() <= 0)
        {
            logger.log(Logger::Level::INFO, "[Delivery][Retention] disabled");
            return;
        }

        logger.log(Logger::Level::INFO,
                   "[Delivery][Retention] every {}s, log retention {}h",
                   interval_.count(), retention_.count());

        auto self = shared_from_this();
        net::post(timer_.get_executor(), [self]()
                  { self->arm(); });
    }

    void RetentionSweeper::stop()
    {
        stopped_ = true;

        auto self = shared_from_this();
        net::post(timer_.get_executor(), [self]()
                  {
                      boost::system::error_code ec;
                      self->timer_.cancel(ec); });
    }

    void RetentionSweeper::arm()
    {
        if (stopped_)
            return;

        timer_.expires_after(interval_);

        auto self = shared_from_this();
        timer_.async_wait([self](const boost::system::error_code &ec)
                          { self->on_timer(ec); });
    }

    void RetentionSweeper::on_timer(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || stopped_)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN, "[Delivery][Retention] timer error: {}", ec.message());
            return;
        }

        if (!running_.exchange(true))
        {
            auto self = shared_from_this();
            net::post(blocking_, [self]()
                      {
                          (void)self->run_once();
                          self->running_ = false; });
        }

        arm();
    }

    RetentionSweeper::Result RetentionSweeper::run_once()
    {
        Result result;
        runs_++;

        if (retention_.count() > 0)
        {
            try
            {
                result.entriesTrimmed = log_->trim_before(clock_() - retention_);
                if (metrics_)
                    metrics_->log_entries_trimmed_total += result.entriesTrimmed;
            }
            catch (const std::exception &e)
            {
                result.ok = false;
                logger.log(Logger::Level::ERROR, "[Delivery][Retention] log trim failed: {}", e.what());
            }
        }

        try
        {
            result.cursorsPurged = syncStore_->purge_expired();
            if (metrics_)
                metrics_->cursors_expired_total += result.cursorsPurged;
        }
        catch (const std::exception &e)
        {
            result.ok = false;
            logger.log(Logger::Level::ERROR, "[Delivery][Retention] cursor purge failed: {}", e.what());
        }

        if (result.entriesTrimmed > 0 || result.cursorsPurged > 0)
        {
            logger.log(Logger::Level::INFO,
                       "[Delivery][Retention] trimmed {} log entries, purged {} cursors",
                       result.entriesTrimmed, result.cursorsPurged);
        }

        return result;
    }

} // namespace convo::delivery

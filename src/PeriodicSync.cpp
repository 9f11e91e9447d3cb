#include <convo/delivery/PeriodicSync.hpp>

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    namespace net = boost::asio;
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    PeriodicSync::PeriodicSync(net::any_io_executor strand,
                               net::any_io_executor blocking,
                               std::shared_ptr<ISyncStateStore> store,
                               std::shared_ptr<CursorCell> cell,
                               SessionIdentity identity,
                               std::chrono::milliseconds interval,
                               std::shared_ptr<DeliveryMetrics> metrics)
        : strand_(strand),
          blocking_(std::move(blocking)),
          store_(std::move(store)),
          cell_(std::move(cell)),
          identity_(std::move(identity)),
          interval_(interval),
          metrics_(std::move(metrics)),
          timer_(strand)
    {
    }

    void PeriodicSync::start()
    {
        if (stopped_)
            return;
        arm();
    }

    void PeriodicSync::arm()
    {
        timer_.expires_after(interval_);

        auto self = shared_from_this();
        timer_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_tick(ec);
            });
    }

    void PeriodicSync::on_tick(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || stopped_)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Delivery][Sync] timer error for {}/{}: {}",
                       identity_.user_id, identity_.client_id, ec.message());
            return;
        }

        write(/*periodic=*/true);
        arm();
    }

    void PeriodicSync::flush_final()
    {
        if (stopped_)
            return;

        write(/*periodic=*/false);
        stop();
    }

    void PeriodicSync::stop()
    {
        stopped_ = true;

        boost::system::error_code ec;
        timer_.cancel(ec);
    }

    void PeriodicSync::write(bool periodic)
    {
        if (periodic && inFlight_.exchange(true))
        {
            ticksSkipped_++;
            logger.log(Logger::Level::TRACE,
                       "[Delivery][Sync] previous write still in flight, tick skipped");
            return;
        }

        ClientSyncState state;
        state.client_id = identity_.client_id;
        state.user_id = identity_.user_id;
        state.conversation_id = identity_.conversation_id;
        state.last_message_id = cell_->get();
        state.last_sync_at = SystemClock::now();

        auto self = shared_from_this();
        net::post(
            blocking_,
            [self, state = std::move(state), periodic]()
            {
                try
                {
                    self->store_->put(state);
                    self->writesCompleted_++;
                    if (self->metrics_)
                        self->metrics_->sync_writes_total++;

                    logger.log(Logger::Level::TRACE,
                               "[Delivery][Sync] {}/{}/{} cursor={}{}",
                               state.user_id, state.client_id, state.conversation_id,
                               state.last_message_id.to_string(), periodic ? "" : " (final)");
                }
                catch (const std::exception &e)
                {
                    if (self->metrics_)
                        self->metrics_->sync_write_failures_total++;

                    logger.log(Logger::Level::WARN,
                               "[Delivery][Sync] cursor write for {}/{} failed: {}",
                               state.user_id, state.client_id, e.what());
                }

                if (periodic)
                    self->inFlight_ = false;
            });
    }

} // namespace convo::delivery

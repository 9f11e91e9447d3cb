#include <convo/delivery/ConnectionSession.hpp>

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include <convo/delivery/protocol.hpp>
#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    namespace net = boost::asio;
    namespace ws = boost::beast::websocket;
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    ConnectionSession::ConnectionSession(std::shared_ptr<const DeliveryContext> ctx,
                                         SessionIdentity identity,
                                         net::any_io_executor strand,
                                         std::shared_ptr<ClientChannel> channel)
        : ctx_(std::move(ctx)),
          identity_(std::move(identity)),
          strand_(std::move(strand)),
          channel_(std::move(channel)),
          cell_(std::make_shared<CursorCell>())
    {
    }

    ConnectionSession::~ConnectionSession()
    {
        // Torn down without reaching Closed (io_context stopped under us).
        if (started_ && state_.load() != State::Closed && ctx_->metrics)
            ctx_->metrics->connections_active--;
    }

    const char *ConnectionSession::to_string(State state) noexcept
    {
        switch (state)
        {
        case State::Connecting:
            return "connecting";
        case State::CatchingUp:
            return "catching-up";
        case State::Live:
            return "live";
        case State::Closing:
            return "closing";
        case State::Closed:
            return "closed";
        }
        return "unknown";
    }

    const char *ConnectionSession::to_string(CloseCause cause) noexcept
    {
        switch (cause)
        {
        case CloseCause::ClientClosed:
            return "client-closed";
        case CloseCause::TransportError:
            return "transport-error";
        case CloseCause::IdleTimeout:
            return "idle-timeout";
        case CloseCause::CatchupFailed:
            return "catchup-failed";
        case CloseCause::SlowConsumer:
            return "slow-consumer";
        case CloseCause::Shutdown:
            return "shutdown";
        }
        return "unknown";
    }

    std::optional<ConnectionSession::CloseCause> ConnectionSession::close_cause() const
    {
        if (!hasCloseCause_.load())
            return std::nullopt;
        return closeCause_;
    }

    bool ConnectionSession::closing() const noexcept
    {
        const State s = state_.load();
        return s == State::Closing || s == State::Closed;
    }

    // ───────────────────────── Connecting ─────────────────────────

    void ConnectionSession::start()
    {
        auto self = shared_from_this();
        net::post(strand_, [self]()
                  { self->do_start(); });
    }

    void ConnectionSession::do_start()
    {
        if (started_ || closing())
            return;

        started_ = true;
        if (ctx_->metrics)
        {
            ctx_->metrics->connections_total++;
            ctx_->metrics->connections_active++;
        }

        // Registered before the cursor load and the first read, drained only
        // once catch-up is done.
        std::weak_ptr<ConnectionSession> weak = weak_from_this();
        auto strand = strand_;
        subscription_ = ctx_->registry->subscribe(
            identity_.conversation_id,
            ctx_->config.subscriberCapacity,
            [weak, strand]()
            {
                net::post(strand, [weak]()
                          {
                              if (auto self = weak.lock())
                                  self->pump(); });
            });

        logger.log(Logger::Level::INFO,
                   "[Delivery][Session] {} user={} client={} connecting",
                   identity_.conversation_id, identity_.user_id, identity_.client_id);

        auto self = shared_from_this();
        net::post(
            ctx_->blockingExecutor,
            [self]()
            {
                const auto &ctx = *self->ctx_;
                const auto &id = self->identity_;

                LoadResult result;
                try
                {
                    result.stored = ctx.syncStore->get(id.user_id, id.client_id, id.conversation_id);
                    result.floor = ctx.log->retention_floor(id.conversation_id);
                    result.latest = ctx.log->latest_id(id.conversation_id);
                }
                catch (const std::exception &e)
                {
                    result.error = e.what();
                }

                net::post(self->strand_, [self, result = std::move(result)]() mutable
                          { self->on_cursor_loaded(std::move(result)); });
            });
    }

    void ConnectionSession::on_cursor_loaded(LoadResult result)
    {
        if (state_.load() != State::Connecting)
            return;

        if (result.error)
        {
            if (ctx_->metrics)
                ctx_->metrics->catchup_failures_total++;

            logger.log(Logger::Level::ERROR,
                       "[Delivery][Session] {} client={} cursor load failed: {}",
                       identity_.conversation_id, identity_.client_id, *result.error);

            close(CloseCause::CatchupFailed,
                  ws::close_reason(ws::close_code::internal_error, "cursor unavailable"));
            return;
        }

        StreamEntryId cursor = result.stored ? result.stored->last_message_id : kBeginning;
        cell_->advance(cursor);
        cursorLoaded_ = true;

        control_.emplace_back(protocol::session_ready(identity_, cursor), std::nullopt);

        if (!cursor.is_beginning() && cursor < result.floor)
        {
            const StreamEntryId latest = std::max(result.latest.value_or(result.floor), result.floor);

            if (ctx_->metrics)
                ctx_->metrics->stale_cursor_resets_total++;

            logger.log(Logger::Level::WARN,
                       "[Delivery][Session] {} client={} cursor {} below retention floor {}, resetting to {}",
                       identity_.conversation_id, identity_.client_id,
                       cursor.to_string(), result.floor.to_string(), latest.to_string());

            control_.emplace_back(protocol::sync_reset(identity_.conversation_id, latest), latest);
            cursor = latest;
            catchupExhausted_ = true;
        }

        readCursor_ = cursor;
        highestQueued_ = cursor;
        state_ = State::CatchingUp;

        logger.log(Logger::Level::DEBUG,
                   "[Delivery][Session] {} client={} catching up from {}",
                   identity_.conversation_id, identity_.client_id, cursor.to_string());

        sync_ = std::make_shared<PeriodicSync>(strand_,
                                               ctx_->blockingExecutor,
                                               ctx_->syncStore,
                                               cell_,
                                               identity_,
                                               ctx_->config.syncInterval,
                                               ctx_->metrics);
        sync_->start();

        pump();
    }

    // ───────────────────────── CatchingUp ─────────────────────────

    void ConnectionSession::read_next_page()
    {
        readingPage_ = true;

        auto self = shared_from_this();
        const StreamEntryId after = readCursor_;
        const std::size_t limit = std::max<std::size_t>(1, ctx_->config.catchupBatchSize);

        net::post(
            ctx_->blockingExecutor,
            [self, after, limit]()
            {
                PageResult result;
                try
                {
                    result.events = self->ctx_->log->read_since(self->identity_.conversation_id, after, limit);
                }
                catch (const std::exception &e)
                {
                    result.error = e.what();
                }

                net::post(self->strand_, [self, result = std::move(result)]() mutable
                          { self->on_page(std::move(result)); });
            });
    }

    void ConnectionSession::on_page(PageResult result)
    {
        readingPage_ = false;

        if (closing())
            return;

        if (result.error)
        {
            if (ctx_->metrics)
                ctx_->metrics->catchup_failures_total++;

            logger.log(Logger::Level::ERROR,
                       "[Delivery][Session] {} client={} catch-up read after {} failed: {}",
                       identity_.conversation_id, identity_.client_id,
                       readCursor_.to_string(), *result.error);

            close(CloseCause::CatchupFailed,
                  ws::close_reason(ws::close_code::internal_error, "catch-up failed"));
            return;
        }

        if (result.events.size() < std::max<std::size_t>(1, ctx_->config.catchupBatchSize))
            catchupExhausted_ = true;

        if (!result.events.empty())
        {
            readCursor_ = result.events.back().stream_entry_id;
            highestQueued_ = std::max(highestQueued_, readCursor_);
        }

        for (auto &ev : result.events)
            page_.push_back(std::move(ev));

        pump();
    }

    void ConnectionSession::replay_from(StreamEntryId after)
    {
        if (state_.load() != State::Live)
        {
            logger.log(Logger::Level::DEBUG,
                       "[Delivery][Session] {} client={} sync.request ignored while {}",
                       identity_.conversation_id, identity_.client_id, to_string(state_.load()));
            return;
        }

        logger.log(Logger::Level::INFO,
                   "[Delivery][Session] {} client={} replaying after {} on request",
                   identity_.conversation_id, identity_.client_id, after.to_string());

        // Live events keep buffering in the subscription; ids at or below
        // highestQueued_ are dropped when the replay hands back to live.
        readCursor_ = after;
        catchupExhausted_ = false;
        state_ = State::CatchingUp;
        pump();
    }

    void ConnectionSession::go_live()
    {
        state_ = State::Live;
        liveSince_ = SystemClock::now();

        logger.log(Logger::Level::INFO,
                   "[Delivery][Session] {} client={} live at {}",
                   identity_.conversation_id, identity_.client_id, highestQueued_.to_string());
    }

    // ───────────────────────── Output loop ─────────────────────────

    void ConnectionSession::pump()
    {
        if (closing() || state_.load() == State::Connecting)
            return;

        if (subscription_ && subscription_->overflowed())
        {
            if (ctx_->metrics)
                ctx_->metrics->overflow_disconnects_total++;

            logger.log(Logger::Level::WARN,
                       "[Delivery][Session] {} client={} too slow, live queue overflowed",
                       identity_.conversation_id, identity_.client_id);

            close(CloseCause::SlowConsumer,
                  ws::close_reason(ws::close_code::try_again_later, "resync"));
            return;
        }

        if (writing_)
            return;

        if (!control_.empty())
        {
            auto [frame, advanceTo] = std::move(control_.front());
            control_.pop_front();
            send(std::move(frame), advanceTo, /*live=*/false);
            return;
        }

        if (state_.load() == State::CatchingUp)
        {
            if (!page_.empty())
            {
                BroadcastEvent ev = std::move(page_.front());
                page_.pop_front();
                const StreamEntryId id = ev.stream_entry_id;
                send(protocol::message(ev), id, /*live=*/false);
                return;
            }

            if (!catchupExhausted_)
            {
                if (!readingPage_)
                    read_next_page();
                return;
            }

            go_live();
        }

        while (auto ev = subscription_->poll())
        {
            if (ev->kind == EventKind::Signal)
            {
                if (ev->origin_client_id == identity_.client_id)
                    continue;

                if (ev->produced_at < liveSince_)
                {
                    logger.log(Logger::Level::TRACE,
                               "[Delivery][Session] {} dropping typing signal queued during catch-up",
                               identity_.conversation_id);
                    continue;
                }

                if (ctx_->metrics)
                    ctx_->metrics->signals_out_total++;

                send(protocol::typing_started(ev->conversation_id, protocol::typing_signal_user(ev->payload)),
                     std::nullopt, /*live=*/true);
                return;
            }

            if (ev->stream_entry_id <= highestQueued_)
            {
                if (ctx_->metrics)
                    ctx_->metrics->duplicates_suppressed_total++;

                logger.log(Logger::Level::TRACE,
                           "[Delivery][Session] {} dropping {} already sent by catch-up",
                           identity_.conversation_id, ev->stream_entry_id.to_string());
                continue;
            }

            highestQueued_ = ev->stream_entry_id;
            send(protocol::message(*ev), ev->stream_entry_id, /*live=*/true);
            return;
        }
    }

    void ConnectionSession::send(std::string frame, std::optional<StreamEntryId> advanceTo, bool live)
    {
        writing_ = true;

        auto self = shared_from_this();
        channel_->async_send(
            std::move(frame),
            [self, advanceTo, live](const boost::system::error_code &ec)
            {
                self->on_sent(ec, advanceTo, live);
            });
    }

    void ConnectionSession::on_sent(const boost::system::error_code &ec,
                                    std::optional<StreamEntryId> advanceTo,
                                    bool live)
    {
        writing_ = false;

        if (closing())
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Delivery][Session] {} client={} send failed: {}",
                       identity_.conversation_id, identity_.client_id, ec.message());
            close(CloseCause::TransportError, std::nullopt);
            return;
        }

        if (advanceTo)
        {
            cell_->advance(*advanceTo);

            if (ctx_->metrics)
            {
                if (live)
                    ctx_->metrics->live_events_total++;
                else
                    ctx_->metrics->catchup_events_total++;
            }
        }

        pump();
    }

    // ───────────────────────── Inbound ─────────────────────────

    void ConnectionSession::on_client_frame(std::string text)
    {
        if (closing())
            return;

        if (ctx_->metrics)
            ctx_->metrics->frames_in_total++;

        auto frame = protocol::parse_inbound(text);
        if (!frame)
        {
            if (ctx_->metrics)
                ctx_->metrics->frames_malformed_total++;

            logger.log(Logger::Level::DEBUG,
                       "[Delivery][Session] {} client={} ignoring frame ({} bytes)",
                       identity_.conversation_id, identity_.client_id, text.size());
            return;
        }

        switch (frame->kind)
        {
        case protocol::InboundFrame::Kind::Typing:
            if (frame->conversation_id != identity_.conversation_id || frame->user_id != identity_.user_id)
            {
                if (ctx_->metrics)
                    ctx_->metrics->frames_malformed_total++;

                logger.log(Logger::Level::DEBUG,
                           "[Delivery][Session] {} client={} typing for {}/{} ignored",
                           identity_.conversation_id, identity_.client_id,
                           frame->conversation_id, frame->user_id);
                return;
            }

            if (ctx_->publisher)
            {
                ctx_->publisher->signal(identity_.conversation_id,
                                        protocol::typing_signal_payload(identity_.user_id),
                                        identity_.client_id);
            }
            break;

        case protocol::InboundFrame::Kind::Ack:
            logger.log(Logger::Level::DEBUG,
                       "[Delivery][Session] {} client={} ack {}",
                       identity_.conversation_id, identity_.client_id, frame->msg_id);
            break;

        case protocol::InboundFrame::Kind::SyncRequest:
            replay_from(frame->after.value_or(cell_->get()));
            break;
        }
    }

    // ───────────────────────── Closing ─────────────────────────

    void ConnectionSession::on_transport_closed(CloseCause cause)
    {
        close(cause, std::nullopt);
    }

    void ConnectionSession::shutdown()
    {
        auto self = shared_from_this();
        net::post(strand_, [self]()
                  { self->close(CloseCause::Shutdown,
                                ws::close_reason(ws::close_code::going_away, "server shutdown")); });
    }

    void ConnectionSession::close(CloseCause cause, std::optional<ws::close_reason> reason)
    {
        if (closing())
            return;

        const State previous = state_.exchange(State::Closing);
        closeCause_ = cause;
        hasCloseCause_ = true;

        logger.log(cause == CloseCause::ClientClosed || cause == CloseCause::Shutdown
                       ? Logger::Level::INFO
                       : Logger::Level::WARN,
                   "[Delivery][Session] {} client={} closing from {} ({}), cursor={}",
                   identity_.conversation_id, identity_.client_id,
                   to_string(previous), to_string(cause), cell_->get().to_string());

        // Final write goes out first; teardown does not wait for it.
        if (sync_)
            sync_->flush_final();

        if (subscription_)
        {
            subscription_->release();
            subscription_.reset();
        }

        control_.clear();
        page_.clear();

        if (reason && channel_)
            channel_->close(*reason);
        channel_.reset();

        state_ = State::Closed;

        if (started_ && ctx_->metrics)
            ctx_->metrics->connections_active--;

        auto handler = std::move(onClosed_);
        onClosed_ = nullptr;
        if (handler)
            handler(cause);
    }

} // namespace convo::delivery

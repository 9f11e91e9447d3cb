#ifndef CONVO_DELIVERY_CONNECTION_SESSION_HPP
#define CONVO_DELIVERY_CONNECTION_SESSION_HPP

/**
 * @file ConnectionSession.hpp
 * @brief Per-connection delivery state machine.
 *
 * Connecting → CatchingUp → Live → Closing → Closed
 *
 * Everything runs on one strand. The live subscription is registered before
 * the cursor is loaded and before the first log read, but is only drained
 * once catch-up has sent its last page. Live message events whose id was
 * already queued by catch-up are dropped, so the seam between replay and
 * live delivery has neither gaps nor duplicates.
 *
 * Outbound frames go out one at a time through the ClientChannel, in this
 * priority order: control frames, catch-up pages, live events. The cursor
 * advances only after a message frame was written successfully.
 */

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/system/error_code.hpp>

#include <convo/delivery/BroadcastRegistry.hpp>
#include <convo/delivery/ClientChannel.hpp>
#include <convo/delivery/CursorCell.hpp>
#include <convo/delivery/PeriodicSync.hpp>
#include <convo/delivery/context.hpp>
#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    class ConnectionSession : public std::enable_shared_from_this<ConnectionSession>
    {
    public:
        enum class State
        {
            Connecting,
            CatchingUp,
            Live,
            Closing,
            Closed
        };

        enum class CloseCause
        {
            ClientClosed,
            TransportError,
            IdleTimeout,
            CatchupFailed, ///< cursor load or log read failed (1011)
            SlowConsumer,  ///< live queue overflowed (1013)
            Shutdown       ///< server going away (1001)
        };

        using ClosedHandler = std::function<void(CloseCause)>;

        /// `strand` must serialize every call into this session, including the
        /// channel's send completions.
        ConnectionSession(std::shared_ptr<const DeliveryContext> ctx,
                          SessionIdentity identity,
                          boost::asio::any_io_executor strand,
                          std::shared_ptr<ClientChannel> channel);

        ~ConnectionSession();

        ConnectionSession(const ConnectionSession &) = delete;
        ConnectionSession &operator=(const ConnectionSession &) = delete;

        /// Subscribe, load the cursor and begin catch-up. Posts to the strand.
        void start();

        /// Inbound text frame. Must be called on the strand.
        void on_client_frame(std::string text);

        /// The transport is gone. Must be called on the strand.
        void on_transport_closed(CloseCause cause);

        /// Close with 1001 from any thread.
        void shutdown();

        void set_on_closed(ClosedHandler handler) { onClosed_ = std::move(handler); }

        [[nodiscard]] State state() const noexcept { return state_.load(); }
        [[nodiscard]] StreamEntryId cursor() const { return cell_->get(); }
        [[nodiscard]] const SessionIdentity &identity() const noexcept { return identity_; }
        [[nodiscard]] std::optional<CloseCause> close_cause() const;

        [[nodiscard]] static const char *to_string(State state) noexcept;
        [[nodiscard]] static const char *to_string(CloseCause cause) noexcept;

    private:
        struct LoadResult
        {
            std::optional<ClientSyncState> stored;
            StreamEntryId floor;
            std::optional<StreamEntryId> latest;
            std::optional<std::string> error;
        };

        struct PageResult
        {
            std::vector<BroadcastEvent> events;
            std::optional<std::string> error;
        };

        void do_start();
        void on_cursor_loaded(LoadResult result);

        void read_next_page();
        void on_page(PageResult result);

        /// Emit the next frame if nothing is being written.
        void pump();

        void replay_from(StreamEntryId after);
        void go_live();

        void send(std::string frame, std::optional<StreamEntryId> advanceTo, bool live);
        void on_sent(const boost::system::error_code &ec, std::optional<StreamEntryId> advanceTo, bool live);

        /// Closing → Closed. `reason` set when a close frame must be sent.
        void close(CloseCause cause, std::optional<boost::beast::websocket::close_reason> reason);

        [[nodiscard]] bool closing() const noexcept;

        std::shared_ptr<const DeliveryContext> ctx_;
        SessionIdentity identity_;
        boost::asio::any_io_executor strand_;
        std::shared_ptr<ClientChannel> channel_;

        std::atomic<State> state_{State::Connecting};
        std::atomic<bool> hasCloseCause_{false};
        CloseCause closeCause_ = CloseCause::ClientClosed;

        std::shared_ptr<Subscription> subscription_;
        std::shared_ptr<CursorCell> cell_;
        std::shared_ptr<PeriodicSync> sync_;
        bool started_ = false;
        bool cursorLoaded_ = false;

        /// Control frames, with the id to record once written (sync.reset).
        std::deque<std::pair<std::string, std::optional<StreamEntryId>>> control_;
        std::deque<BroadcastEvent> page_;
        StreamEntryId readCursor_;
        StreamEntryId highestQueued_;
        /// Signals produced before this instant are dropped as stale.
        SystemClock::time_point liveSince_ = SystemClock::time_point::max();
        bool readingPage_ = false;
        bool catchupExhausted_ = false;
        bool writing_ = false;

        ClosedHandler onClosed_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_CONNECTION_SESSION_HPP

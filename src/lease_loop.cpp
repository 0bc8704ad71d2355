#include "lease_loop.hpp"
#include <asio/co_spawn.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <atomic>

namespace pull {

namespace detail {

using loop_strand = asio::strand<asio::any_io_executor>;

// Wakes the loop coroutine when a channel has new input or closes, or when
// the owning lease_loop is destroyed. ring() and abandon() are thread-safe;
// wait_until() runs on the strand.
class doorbell : public std::enable_shared_from_this<doorbell> {
public:
    explicit doorbell(loop_strand strand)
        : m_strand(strand), m_timer(strand) {}

    void abandon() {
        m_abandoned.store(true, std::memory_order_release);
        ring();
    }

    bool abandoned() const { return m_abandoned.load(std::memory_order_acquire); }

    void ring() {
        // One wake-up in flight is enough, the loop drains everything.
        if (m_pending.exchange(true, std::memory_order_acq_rel)) return;

        asio::post(m_strand, [self = shared_from_this()] {
            self->m_pending.exchange(false, std::memory_order_acq_rel);
            self->m_timer.cancel();
        });
    }

    asio::awaitable<void> wait_until(lease_clock::time_point deadline) {
        m_timer.expires_at(deadline);
        asio::error_code ec;
        co_await m_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        // operation_aborted means ring() fired; either way the caller re-polls.
    }

private:
    loop_strand m_strand;
    asio::steady_timer m_timer;
    std::atomic<bool> m_pending{false};
    std::atomic<bool> m_abandoned{false};
};

} // namespace detail

namespace {

using detail::doorbell;

void apply(lease_state& state, ack_result result) {
    switch (result.action) {
        case ack_action::ack:  state.ack(std::move(result.ack_id)); break;
        case ack_action::nack: state.nack(std::move(result.ack_id)); break;
    }
}

// Processes the decisions the application already sent, without waiting
// for more, then shuts the lease state down.
asio::awaitable<void> drain_and_shutdown(lease_state state,
                                         channel_receiver<ack_result>& ack_rx,
                                         spdlog::logger& log)
{
    std::size_t drained = 0;
    ack_result result;
    while (ack_rx.try_receive(result) == receive_status::received) {
        apply(state, std::move(result));
        ++drained;
    }

    log.info("lease_loop: message stream closed, shutting down ({} queued decisions)",
             drained);
    co_await std::move(state).shutdown();
    log.debug("lease_loop: shutdown complete");
}

asio::awaitable<void> run(lease_state state,
                          channel_receiver<std::string> message_rx,
                          channel_receiver<ack_result> ack_rx,
                          std::shared_ptr<doorbell> bell,
                          std::shared_ptr<spdlog::logger> log)
{
    std::string ack_id;
    ack_result result;

    // Sources are checked in a fixed order on every iteration. Only when
    // none is ready does the loop block, until the next timer deadline or
    // until a producer rings the bell.
    while (true) {
        if (bell->abandoned()) {
            log->debug("lease_loop: abandoned, exiting without flush");
            co_return;
        }

        if (auto event = state.poll_event(lease_clock::now())) {
            switch (*event) {
                case lease_event::flush:  co_await state.flush(); break;
                case lease_event::extend: co_await state.extend(); break;
            }
            continue;
        }

        switch (message_rx.try_receive(ack_id)) {
            case receive_status::received:
                state.add(std::move(ack_id));
                continue;
            case receive_status::closed:
                co_await drain_and_shutdown(std::move(state), ack_rx, *log);
                co_return;
            case receive_status::empty:
                break;
        }

        switch (ack_rx.try_receive(result)) {
            case receive_status::received:
                // The message may have been sent just before the decision
                // and after the check above.
                while (message_rx.try_receive(ack_id) == receive_status::received) {
                    state.add(std::move(ack_id));
                }
                apply(state, std::move(result));
                continue;
            case receive_status::closed:
                log->info("lease_loop: decision channel closed, exiting without flush");
                co_return;
            case receive_status::empty:
                break;
        }

        co_await bell->wait_until(state.next_deadline());
    }
}

} // namespace

lease_loop::lease_loop(asio::any_io_executor executor,
                       std::shared_ptr<leaser> leaser,
                       const lease_options& options,
                       std::shared_ptr<spdlog::logger> log)
{
    auto strand = asio::make_strand(executor);
    auto bell = std::make_shared<doorbell>(strand);
    m_bell = bell;

    auto [message_tx, message_rx] = make_channel<std::string>([bell] { bell->ring(); });
    auto [ack_tx, ack_rx] = make_channel<ack_result>([bell] { bell->ring(); });
    m_message_tx = std::move(message_tx);
    m_ack_tx = std::move(ack_tx);

    lease_state state(std::move(leaser), options, log);
    m_handle = asio::co_spawn(
        strand,
        run(std::move(state), std::move(message_rx), std::move(ack_rx),
            std::move(bell), std::move(log)),
        asio::use_future);
}

lease_loop::~lease_loop() {
    if (m_bell) m_bell->abandon();
}

} // namespace pull

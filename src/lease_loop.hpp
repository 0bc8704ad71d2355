#pragma once

#include "ack_result.hpp"
#include "channel.hpp"
#include "lease_state.hpp"
#include "leaser.hpp"
#include <asio/any_io_executor.hpp>
#include <spdlog/spdlog.h>
#include <future>
#include <memory>
#include <string>

namespace pull {

namespace detail {
class doorbell;
} // namespace detail

// Runs lease management for one subscription session.
//
// A background coroutine owns the lease_state and services, in this order
// of priority:
//   1. the flush/extend timers,
//   2. new ack ids from the delivery stream (message_tx),
//   3. acks/nacks from the application (ack_tx).
// New messages are always registered before decisions about them.
//
// Closing the message channel drains the queued decisions, flushes and
// nacks whatever is still leased, then completes handle(). Closing the
// decision channel ends the loop without a flush. Destroying a lease_loop
// abandons the loop: it never blocks, and pending acks/nacks are not sent.
// The caller must keep the executor's io_context alive while any sender
// exists.
class lease_loop {
public:
    lease_loop(asio::any_io_executor executor,
               std::shared_ptr<leaser> leaser,
               const lease_options& options,
               std::shared_ptr<spdlog::logger> log);

    lease_loop(lease_loop&&) = default;
    lease_loop& operator=(lease_loop&&) = delete;
    lease_loop(const lease_loop&) = delete;
    lease_loop& operator=(const lease_loop&) = delete;

    ~lease_loop();

    // For sending ack ids from the delivery stream into the loop.
    channel_sender<std::string>& message_tx() { return m_message_tx; }

    // For sending decisions from the application into the loop. Copy it to
    // hand out to ack handlers.
    channel_sender<ack_result>& ack_tx() { return m_ack_tx; }

    // Ready once the loop has exited. Rethrows anything the leaser threw.
    std::future<void>& handle() { return m_handle; }

private:
    channel_sender<std::string> m_message_tx;
    channel_sender<ack_result> m_ack_tx;
    std::future<void> m_handle;
    std::shared_ptr<detail::doorbell> m_bell;
};

} // namespace pull

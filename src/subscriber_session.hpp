#pragma once

#include "ack_handler.hpp"
#include "config.hpp"
#include "jetstream_leaser.hpp"
#include "lease_loop.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pull {

struct received_message {
    std::string subject;
    std::vector<char> payload;
};

// Publishes through a NATS connection, for jetstream_leaser.
publish_fn make_nats_publisher(nats_asio::iconnection_sptr conn);

// Invoked on the io_context thread for every delivered message. The handler
// nacks the message if it is destroyed without a decision.
using message_callback = std::function<void(received_message, ack_handler)>;

// Receives messages from a JetStream push consumer and keeps them under
// lease management until the application decides about them.
class subscriber_session {
public:
    subscriber_session(asio::io_context& ioc, const config& cfg,
                       message_callback on_message,
                       std::shared_ptr<spdlog::logger> log);

    // Called once the NATS connection is established.
    // Starts lease management and subscribes to the deliver subject.
    // Returns false if the session was closed first or the subscribe failed;
    // in the latter case the session is closed.
    asio::awaitable<bool> start(nats_asio::iconnection_sptr conn);

    // Stop accepting messages. Queued decisions are flushed and every
    // message still leased is nacked. Call on the io_context thread.
    void close();

    // Block until lease management has shut down after close().
    // Returns immediately if the session never started. Rethrows leaser
    // failures. Must not be called on the io_context thread.
    void wait_closed();

private:
    // Callback: incoming message on the deliver subject
    asio::awaitable<void> on_message(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    message_callback m_on_message;
    std::shared_ptr<spdlog::logger> m_log;

    nats_asio::iconnection_sptr m_conn;
    std::shared_ptr<jetstream_leaser> m_leaser;
    std::unique_ptr<lease_loop> m_lease_loop;
    bool m_closed = false;

    std::atomic<uint64_t> m_received{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace pull

#include "subscriber_session.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace pull {

publish_fn make_nats_publisher(nats_asio::iconnection_sptr conn) {
    return [conn = std::move(conn)](const std::string& subject, std::span<const char> payload)
               -> asio::awaitable<std::optional<std::string>> {
        auto s = co_await conn->publish(subject, payload, std::nullopt);
        if (s.failed()) co_return fmt::format("{}", s.error());
        co_return std::nullopt;
    };
}

subscriber_session::subscriber_session(asio::io_context& ioc, const config& cfg,
                                       message_callback on_message,
                                       std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_on_message(std::move(on_message)),
      m_log(std::move(log))
{}

asio::awaitable<bool> subscriber_session::start(nats_asio::iconnection_sptr conn) {
    if (m_closed) {
        m_log->info("Session closed before the connection was ready - not subscribing");
        co_return false;
    }

    m_conn = std::move(conn);
    m_leaser = std::make_shared<jetstream_leaser>(make_nats_publisher(m_conn), m_log);
    m_lease_loop = std::make_unique<lease_loop>(
        m_ioc.get_executor(), m_leaser, m_cfg.lease, m_log);

    nats_asio::subscribe_options opts;
    if (!m_cfg.queue_group.empty()) {
        opts.queue_group = m_cfg.queue_group;
    }

    auto [sub, status] = co_await m_conn->subscribe(
        m_cfg.deliver_subject,
        [this](auto subject, auto reply_to, auto payload) {
            return on_message(subject, reply_to, payload);
        },
        opts
    );

    if (status.failed()) {
        m_log->error("Failed to subscribe to deliver subject '{}': {}",
                    m_cfg.deliver_subject, status.error());
        close();
        co_return false;
    }
    m_log->info("Subscribed to deliver subject '{}'", m_cfg.deliver_subject);

    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Subscriber session started (flush every {}ms, extend every {}ms)",
               m_cfg.lease.flush_period.count(), m_cfg.lease.extend_period.count());
    co_return true;
}

void subscriber_session::close() {
    if (m_closed) return;
    m_closed = true;

    if (m_lease_loop) {
        m_lease_loop->message_tx().close();
    }
    m_log->info("Subscriber session closing");
}

void subscriber_session::wait_closed() {
    if (!m_lease_loop) return;

    m_lease_loop->handle().get();
    m_log->info("Lease management stopped (received={} delivered={} dropped={} publish_failures={})",
               m_received.load(), m_delivered.load(), m_dropped.load(),
               m_leaser->publish_failures());
}

asio::awaitable<void> subscriber_session::on_message(
    std::string_view subject,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    m_received++;

    // Without a reply subject there is nothing to ack: not a JetStream delivery.
    if (!reply_to || reply_to->empty()) {
        m_dropped++;
        m_log->warn("Message on '{}' has no reply subject - ignoring", subject);
        co_return;
    }

    std::string ack_id(*reply_to);
    if (!m_lease_loop->message_tx().send(ack_id)) {
        // Closing; the server redelivers once AckWait expires.
        m_dropped++;
        m_log->debug("Session closed - not delivering '{}'", ack_id);
        co_return;
    }

    received_message msg{std::string(subject), std::vector<char>(payload.begin(), payload.end())};
    ack_handler handler(std::move(ack_id), m_lease_loop->ack_tx());
    m_delivered++;

    try {
        m_on_message(std::move(msg), std::move(handler));
    } catch (const std::exception& e) {
        m_log->error("Message callback failed: {}", e.what());
    }
}

asio::awaitable<void> subscriber_session::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (!m_closed) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        m_log->info("stats: received={} delivered={} dropped={} publish_failures={}",
                   m_received.load(),
                   m_delivered.load(),
                   m_dropped.load(),
                   m_leaser->publish_failures());
    }
}

} // namespace pull

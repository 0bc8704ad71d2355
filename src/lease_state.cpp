#include "lease_state.hpp"
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <algorithm>
#include <utility>

namespace pull {

bool lease_interval::tick(lease_clock::time_point now) {
    if (now < m_next) return false;
    m_next += m_period;
    return true;
}

lease_state::lease_state(std::shared_ptr<leaser> leaser,
                         const lease_options& options,
                         std::shared_ptr<spdlog::logger> log,
                         lease_clock::time_point now)
    : m_leaser(std::move(leaser)), m_log(std::move(log)),
      m_flush_interval(now + options.flush_start, options.flush_period),
      m_extend_interval(now + options.extend_start, options.extend_period)
{}

void lease_state::add(std::string ack_id) {
    m_under_lease.insert(std::move(ack_id));
}

void lease_state::ack(std::string ack_id) {
    m_under_lease.erase(ack_id);
    m_to_ack.push_back(std::move(ack_id));
}

void lease_state::nack(std::string ack_id) {
    if (m_under_lease.erase(ack_id) == 0) return;
    m_to_nack.push_back(std::move(ack_id));
}

std::optional<lease_event> lease_state::poll_event(lease_clock::time_point now) {
    if (m_flush_interval.tick(now))  return lease_event::flush;
    if (m_extend_interval.tick(now)) return lease_event::extend;
    return std::nullopt;
}

lease_clock::time_point lease_state::next_deadline() const {
    return std::min(m_flush_interval.deadline(), m_extend_interval.deadline());
}

asio::awaitable<lease_event> lease_state::next_event() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true) {
        if (auto event = poll_event(lease_clock::now())) co_return *event;

        timer.expires_at(next_deadline());
        co_await timer.async_wait(asio::use_awaitable);
    }
}

asio::awaitable<void> lease_state::flush() {
    // Swap the buffers out first. Decisions that arrive while the RPCs are
    // in flight belong to the next flush.
    auto to_ack = std::exchange(m_to_ack, {});
    auto to_nack = std::exchange(m_to_nack, {});

    // TODO: send the ack and nack batches concurrently.
    if (!to_ack.empty()) {
        m_log->debug("lease_state: flushing {} acks", to_ack.size());
        co_await m_leaser->ack(std::move(to_ack));
    }
    if (!to_nack.empty()) {
        m_log->debug("lease_state: flushing {} nacks", to_nack.size());
        co_await m_leaser->nack(std::move(to_nack));
    }
}

asio::awaitable<void> lease_state::extend() {
    if (m_under_lease.empty()) co_return;

    std::vector<std::string> ack_ids(m_under_lease.begin(), m_under_lease.end());
    m_log->debug("lease_state: extending {} leases", ack_ids.size());
    co_await m_leaser->extend(std::move(ack_ids));
}

asio::awaitable<void> lease_state::shutdown() && {
    auto leaser = std::move(m_leaser);
    auto log = std::move(m_log);
    auto to_ack = std::exchange(m_to_ack, {});
    auto to_nack = std::exchange(m_to_nack, {});
    to_nack.insert(to_nack.end(), m_under_lease.begin(), m_under_lease.end());
    m_under_lease.clear();

    log->debug("lease_state: shutdown with {} acks, {} nacks",
               to_ack.size(), to_nack.size());

    if (!to_ack.empty()) {
        co_await leaser->ack(std::move(to_ack));
    }
    if (!to_nack.empty()) {
        co_await leaser->nack(std::move(to_nack));
    }
}

lease_snapshot lease_state::snapshot() const {
    return {
        {m_under_lease.begin(), m_under_lease.end()},
        m_to_ack,
        m_to_nack
    };
}

} // namespace pull

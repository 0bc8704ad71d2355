#pragma once

#include "leaser.hpp"
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace pull {

using lease_clock = std::chrono::steady_clock;

struct lease_options {
    // How often acks/nacks are flushed
    std::chrono::milliseconds flush_period{1000};
    // Delay before the first flush
    std::chrono::milliseconds flush_start{1000};
    // How often leases are extended
    std::chrono::milliseconds extend_period{3000};
    // Delay before the first extension
    std::chrono::milliseconds extend_start{500};
};

// Which timer fired.
enum class lease_event {
    flush,
    extend
};

// The observable part of a lease_state, for comparisons in tests and logs.
struct lease_snapshot {
    std::set<std::string> under_lease;
    std::vector<std::string> to_ack;
    std::vector<std::string> to_nack;

    bool operator==(const lease_snapshot&) const = default;
};

// A recurring deadline. Missed ticks fire back to back until caught up.
class lease_interval {
public:
    lease_interval(lease_clock::time_point first, lease_clock::duration period)
        : m_next(first), m_period(period) {}

    lease_clock::time_point deadline() const { return m_next; }

    // Consume one tick if it is due at `now`.
    bool tick(lease_clock::time_point now);

private:
    lease_clock::time_point m_next;
    lease_clock::duration m_period;
};

// Bookkeeping for messages handed to the application.
//
// Tracks the ack ids under lease and the acks/nacks waiting for the next
// flush. Not thread-safe: a single lease_loop coroutine owns and mutates it.
class lease_state {
public:
    lease_state(std::shared_ptr<leaser> leaser,
                const lease_options& options,
                std::shared_ptr<spdlog::logger> log,
                lease_clock::time_point now = lease_clock::now());

    lease_state(lease_state&&) = default;
    lease_state& operator=(lease_state&&) = default;
    lease_state(const lease_state&) = delete;
    lease_state& operator=(const lease_state&) = delete;

    // Accept a new ack id under lease management. Idempotent.
    void add(std::string ack_id);

    // Process an ack from the application. The ack is recorded even if the
    // message is no longer under lease.
    void ack(std::string ack_id);

    // Process a nack from the application. Ignored unless the message is
    // under lease: an expired lease gets redelivered anyway.
    void nack(std::string ack_id);

    // Return the event due at `now`, if any, and consume that tick.
    // Flush wins when both timers are due.
    std::optional<lease_event> poll_event(lease_clock::time_point now);

    // Earliest point in time at which poll_event() returns an event.
    lease_clock::time_point next_deadline() const;

    // Wait for whichever timer fires first. Callers must not have two
    // waits outstanding on the same state.
    asio::awaitable<lease_event> next_event();

    // Send the pending acks, then the pending nacks.
    asio::awaitable<void> flush();

    // Extend the leases of every message under lease management.
    asio::awaitable<void> extend();

    // Flush pending acks and nack every message still under lease.
    // The state is empty afterwards and must not be used again.
    asio::awaitable<void> shutdown() &&;

    lease_snapshot snapshot() const;

private:
    std::unordered_set<std::string> m_under_lease;
    std::vector<std::string> m_to_ack;
    std::vector<std::string> m_to_nack;
    // TODO: exactly-once delivery needs per-ack results from the leaser.
    std::shared_ptr<leaser> m_leaser;
    std::shared_ptr<spdlog::logger> m_log;

    lease_interval m_flush_interval;
    lease_interval m_extend_interval;
};

} // namespace pull

#pragma once

#include "leaser.hpp"
#include <asio/awaitable.hpp>
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

// Publishes `payload` to `subject`. Yields an error description on failure.
using publish_fn = std::function<asio::awaitable<std::optional<std::string>>(
    const std::string& subject, std::span<const char> payload)>;

// Leaser for JetStream push consumers.
//
// The ack id of a JetStream message is its reply subject. Each decision is
// a publish of a protocol token to that subject:
//   ack    -> "+ACK"
//   nack   -> "-NAK"
//   extend -> "+WPI"  (work in progress, restarts the consumer's AckWait)
// Failed publishes are logged and counted; the message is then redelivered
// by the server once AckWait expires.
class jetstream_leaser : public leaser {
public:
    static constexpr std::string_view ack_token = "+ACK";
    static constexpr std::string_view nack_token = "-NAK";
    static constexpr std::string_view extend_token = "+WPI";

    jetstream_leaser(publish_fn publish,
                     std::shared_ptr<spdlog::logger> log);

    asio::awaitable<void> ack(std::vector<std::string> ack_ids) override;
    asio::awaitable<void> nack(std::vector<std::string> ack_ids) override;
    asio::awaitable<void> extend(std::vector<std::string> ack_ids) override;

    uint64_t publish_failures() const {
        return m_publish_failures.load(std::memory_order_relaxed);
    }

private:
    asio::awaitable<void> publish_all(const std::vector<std::string>& ack_ids,
                                      std::string_view token);

    publish_fn m_publish;
    std::shared_ptr<spdlog::logger> m_log;
    std::atomic<uint64_t> m_publish_failures{0};
};

} // namespace pull

#include "jetstream_leaser.hpp"
#include <utility>

namespace pull {

jetstream_leaser::jetstream_leaser(publish_fn publish,
                                   std::shared_ptr<spdlog::logger> log)
    : m_publish(std::move(publish)), m_log(std::move(log))
{}

asio::awaitable<void> jetstream_leaser::ack(std::vector<std::string> ack_ids) {
    co_await publish_all(ack_ids, ack_token);
}

asio::awaitable<void> jetstream_leaser::nack(std::vector<std::string> ack_ids) {
    co_await publish_all(ack_ids, nack_token);
}

asio::awaitable<void> jetstream_leaser::extend(std::vector<std::string> ack_ids) {
    co_await publish_all(ack_ids, extend_token);
}

asio::awaitable<void> jetstream_leaser::publish_all(const std::vector<std::string>& ack_ids,
                                                    std::string_view token) {
    std::span<const char> payload(token.data(), token.size());
    std::size_t failed = 0;

    for (const auto& ack_id : ack_ids) {
        if (auto error = co_await m_publish(ack_id, payload)) {
            ++failed;
            m_log->debug("jetstream_leaser: failed to send '{}' to '{}': {}",
                         token, ack_id, *error);
        }
    }

    if (failed > 0) {
        m_publish_failures.fetch_add(failed, std::memory_order_relaxed);
        m_log->warn("jetstream_leaser: {} of {} '{}' publishes failed",
                    failed, ack_ids.size(), token);
    }
}

} // namespace pull

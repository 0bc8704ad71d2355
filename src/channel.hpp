#pragma once

#include <concurrentqueue/moodycamel/concurrentqueue.h>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

namespace pull {

enum class receive_status {
    received,
    empty,
    closed
};

namespace detail {

template <typename T>
struct channel_core {
    explicit channel_core(std::function<void()> on_activity)
        : notify(std::move(on_activity)) {}

    moodycamel::ConcurrentQueue<T> queue;
    std::atomic<std::size_t> senders{1};
    std::atomic<bool> closed{false};
    std::atomic<bool> receiver_alive{true};
    // Invoked after every send and when the channel closes, while the
    // receiver exists. Thread-safe.
    std::function<void()> notify;
};

} // namespace detail

// Producer side of an unbounded multi-producer, single-consumer channel.
// Copies share the channel; it closes once every copy is closed or destroyed.
template <typename T>
class channel_sender {
public:
    channel_sender() = default;

    explicit channel_sender(std::shared_ptr<detail::channel_core<T>> core)
        : m_core(std::move(core)) {}

    channel_sender(const channel_sender& other) : m_core(other.m_core) {
        if (m_core) m_core->senders.fetch_add(1, std::memory_order_relaxed);
    }

    channel_sender(channel_sender&& other) noexcept
        : m_core(std::move(other.m_core)) {}

    channel_sender& operator=(channel_sender other) noexcept {
        close();
        m_core = std::move(other.m_core);
        return *this;
    }

    ~channel_sender() { close(); }

    // Returns false if this sender was closed or the receiver is gone.
    bool send(T value) {
        if (!m_core || !m_core->receiver_alive.load(std::memory_order_acquire)) {
            return false;
        }
        m_core->queue.enqueue(std::move(value));
        m_core->notify();
        return true;
    }

    // Release this sender. Idempotent.
    void close() {
        auto core = std::move(m_core);
        if (!core) return;

        if (core->senders.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            core->closed.store(true, std::memory_order_release);
            // Nobody left to wake; the consumer's executor may be gone too.
            if (core->receiver_alive.load(std::memory_order_acquire)) core->notify();
        }
    }

    bool is_closed() const { return !m_core; }

private:
    std::shared_ptr<detail::channel_core<T>> m_core;
};

// Consumer side. Must be used from one thread (or strand) at a time.
template <typename T>
class channel_receiver {
public:
    explicit channel_receiver(std::shared_ptr<detail::channel_core<T>> core)
        : m_core(std::move(core)) {}

    channel_receiver(channel_receiver&&) noexcept = default;
    channel_receiver& operator=(channel_receiver&&) = delete;
    channel_receiver(const channel_receiver&) = delete;
    channel_receiver& operator=(const channel_receiver&) = delete;

    ~channel_receiver() {
        if (m_core) m_core->receiver_alive.store(false, std::memory_order_release);
    }

    // Non-blocking. Reports `closed` only once every value sent before the
    // last sender went away has been received.
    receive_status try_receive(T& out) {
        if (m_core->queue.try_dequeue(out)) return receive_status::received;
        if (!m_core->closed.load(std::memory_order_acquire)) return receive_status::empty;

        if (m_core->queue.try_dequeue(out)) return receive_status::received;
        return receive_status::closed;
    }

private:
    std::shared_ptr<detail::channel_core<T>> m_core;
};

// Create a channel. `notify` runs on the producer's thread after each send
// and once when the channel closes, unless the receiver is already gone.
template <typename T>
std::pair<channel_sender<T>, channel_receiver<T>> make_channel(std::function<void()> notify) {
    auto core = std::make_shared<detail::channel_core<T>>(std::move(notify));
    return {channel_sender<T>(core), channel_receiver<T>(core)};
}

} // namespace pull

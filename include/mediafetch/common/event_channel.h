#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace mediafetch {

// Bounded ring buffer for intra-process events, safe for multiple producers and consumers.
// Capacity must be > 0 (not required to be power-of-two). Producers never block: a push into a
// full channel is dropped and counted.
template <typename T> class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 1024)
        : buf_((capacity ? capacity : 1) + 1), cap_((capacity ? capacity : 1) + 1), head_(0),
          tail_(0) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool try_push(const T& v) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto next = inc(head_);
            if (next == tail_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false; // full
            }
            buf_[head_] = v;
            head_ = next;
        }
        cv_.notify_one();
        return true;
    }

    bool try_push(T&& v) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto next = inc(head_);
            if (next == tail_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false; // full
            }
            buf_[head_] = std::move(v);
            head_ = next;
        }
        cv_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(mu_);
        return popLocked(out);
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mu_);
        T out;
        if (!popLocked(out))
            return std::nullopt;
        return out;
    }

    // Wait up to `timeout` for an event.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        if (!cv_.wait_for(lk, timeout, [this] { return head_ != tail_; }))
            return std::nullopt;
        T out;
        popLocked(out);
        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ == tail_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ >= tail_ ? head_ - tail_ : cap_ - tail_ + head_;
    }

    std::size_t capacity() const noexcept { return cap_ - 1; }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    bool popLocked(T& out) {
        if (tail_ == head_)
            return false; // empty
        out = std::move(buf_[tail_]);
        tail_ = inc(tail_);
        return true;
    }

    std::size_t inc(std::size_t i) const noexcept { return (++i == cap_) ? 0 : i; }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::vector<T> buf_;
    const std::size_t cap_;
    std::size_t head_;
    std::size_t tail_;
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace mediafetch

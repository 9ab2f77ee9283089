// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors
//
// Mailbox primitives shared by the actors. INTERNAL header.

#pragma once

#include "logset/error.hpp"

#include <concurrentqueue.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <format>
#include <future>
#include <new>
#include <semaphore>
#include <string_view>

namespace logset {
namespace detail {

// ============================================================================
// Wakeup - Sleeps an actor loop until some channel has work
//
//   Sender threads                          Actor thread
//   ==============                          ============
//        |  enqueue on channel k                 |
//        |  wakeup.notify()  ------------------> | wait() returns
//        |                                       | serve every channel until empty
//
// Every send releases the semaphore once and the loop acquires it once per
// pass, so a message sent while the loop is busy is never missed: at worst
// the next wait() returns at once and finds nothing left.
// ============================================================================

class Wakeup {
public:
    void notify() { sem_.release(); }

    void wait() { sem_.acquire(); }

    template<typename Clock, typename Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        return sem_.try_acquire_until(deadline);
    }

private:
    std::counting_semaphore<> sem_{0};
};

// ============================================================================
// Channel - Unbounded multi-producer, single-consumer command channel
// ============================================================================

template<typename T>
class Channel {
public:
    static constexpr std::size_t kDefaultCapacity = 32;

    explicit Channel(Wakeup& wakeup, std::size_t initial_capacity = kDefaultCapacity)
        : queue_(initial_capacity), wakeup_(wakeup) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void send(T&& message) {
        if (!queue_.enqueue(std::move(message))) {
            throw std::bad_alloc();
        }
        wakeup_.notify();
    }

    // Consumer side (actor thread only)
    [[nodiscard]] bool try_receive(T& out) {
        return queue_.try_dequeue(out);
    }

    [[nodiscard]] std::size_t size_approx() const noexcept {
        return queue_.size_approx();
    }

private:
    moodycamel::ConcurrentQueue<T> queue_;
    Wakeup& wakeup_;
};

// ============================================================================
// BoundedChannel - Channel whose senders block while it holds Capacity items
// ============================================================================

template<typename T, std::ptrdiff_t Capacity>
class BoundedChannel {
public:
    explicit BoundedChannel(Wakeup& wakeup)
        : queue_(static_cast<std::size_t>(Capacity)), wakeup_(wakeup) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /// Blocks until a slot is free
    void send(T&& message) {
        send(std::move(message), [](T&) {});
    }

    /// As send(), with `stamp` applied to the message once its slot is held,
    /// right before it is enqueued
    template<typename Stamp>
    void send(T&& message, Stamp&& stamp) {
        slots_.acquire();
        stamp(message);
        if (!queue_.enqueue(std::move(message))) {
            slots_.release();
            throw std::bad_alloc();
        }
        wakeup_.notify();
    }

    [[nodiscard]] bool try_receive(T& out) {
        if (!queue_.try_dequeue(out)) {
            return false;
        }
        slots_.release();
        return true;
    }

    [[nodiscard]] std::size_t size_approx() const noexcept {
        return queue_.size_approx();
    }

private:
    moodycamel::ConcurrentQueue<T> queue_;
    std::counting_semaphore<Capacity> slots_{Capacity};
    Wakeup& wakeup_;
};

// ============================================================================
// SenderGuard - Leaves an actor's in-flight sender count on every path out of
// a post, exceptions included
// ============================================================================

struct SenderGuard {
    std::atomic<int>& senders;
    ~SenderGuard() { senders.fetch_sub(1); }
};

// ============================================================================
// Bounded wait for an actor's reply. Expiry means the actor loop is stuck,
// which is fatal.
// ============================================================================

template<typename Future, typename Rep, typename Period>
decltype(auto) await_reply(Future& reply,
                           std::chrono::duration<Rep, Period> bound,
                           std::string_view request) {
    if (reply.wait_for(bound) != std::future_status::ready) {
        fatal(FatalError(FatalKind::Liveness,
            std::format("no reply to {} within {}ms", request,
                std::chrono::duration_cast<std::chrono::milliseconds>(bound).count())));
    }
    return reply.get();
}

} // namespace detail
} // namespace logset

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine type whose outcome is published through a std::future
//==========================================================================================================

#pragma once

#include <chrono>
#include <concepts>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

namespace mcpbridge {
namespace async {

namespace detail {

// Shared promise plumbing. The coroutine never suspends at its start or end, so the frame is
// destroyed as soon as the body finishes and only the std::future outlives it.
template <typename T>
struct PromiseCore {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

template <typename T, typename TaskT>
struct Promise : PromiseCore<T> {
    TaskT get_return_object() { return TaskT(this->promise.get_future()); }
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
};

template <typename TaskT>
struct Promise<void, TaskT> : PromiseCore<void> {
    TaskT get_return_object() { return TaskT(this->promise.get_future()); }
    void return_void() { this->promise.set_value(); }
};

} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Return type of the session coroutines (start, tools/call, forwarded requests, ping).
//          The body runs on the caller's thread until its first co_await; exceptions escaping it,
//          errors::BridgeError included, are rethrown by future.get().
// Usage:
//   Task<JSONValue> run() { co_return JSONValue(); }
//   std::future<JSONValue> f = run().toFuture();
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::Promise<T, Task<T>>;

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Releases the outcome. A Task whose future is dropped still runs to completion.
    std::future<T> toFuture() { return std::move(fut); }

private:
    friend promise_type;
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}

    std::future<T> fut;
};

//==========================================================================================================
// TaskCounter
// Purpose: Counts coroutine bodies still running so their owner can wait for them before going away.
// Usage:
//   auto running = counter->Enter();   // first local of the coroutine, released when the body ends
//   counter->WaitIdle(limit);          // owner side, after cancelling the work
// Notes:
//   Tokens keep the counter alive, so a body may outlive the object that owns the counter.
//==========================================================================================================
class TaskCounter : public std::enable_shared_from_this<TaskCounter> {
public:
    class Token {
    public:
        explicit Token(std::shared_ptr<TaskCounter> c) : counter(std::move(c)) {}
        Token(Token&& other) noexcept = default;
        Token& operator=(Token&&) = delete;
        Token(const Token&) = delete;
        Token& operator=(const Token&) = delete;
        ~Token() {
            if (counter) {
                counter->leave();
            }
        }

    private:
        std::shared_ptr<TaskCounter> counter;
    };

    Token Enter() {
        std::lock_guard<std::mutex> lock(mutex);
        ++active;
        return Token(shared_from_this());
    }

    // Returns false when bodies are still running after `limit`.
    bool WaitIdle(std::chrono::milliseconds limit) {
        std::unique_lock<std::mutex> lock(mutex);
        return idle.wait_for(lock, limit, [this] { return active == 0; });
    }

    std::size_t Active() const {
        std::lock_guard<std::mutex> lock(mutex);
        return active;
    }

private:
    void leave() {
        std::lock_guard<std::mutex> lock(mutex);
        if (--active == 0) {
            idle.notify_all();
        }
    }

    mutable std::mutex mutex;
    std::condition_variable idle;
    std::size_t active{0};
};

} // namespace async
} // namespace mcpbridge

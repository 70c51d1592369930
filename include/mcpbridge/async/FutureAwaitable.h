//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: co_await support for the std::future values returned by ProcessTransport and ServerSession
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace mcpbridge {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends a coroutine until a future is ready.
// Notes:
//   - A ready future (e.g. a request that already failed with TransportClosed) resumes inline.
//   - Otherwise the coroutine resumes on a detached waiter thread. Deadlines are enforced by the
//     producer of the future, so the waiter never blocks longer than the request timeout.
//   - await_resume rethrows whatever the producer stored.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpbridge

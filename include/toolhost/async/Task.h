//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Coroutine Task type bridging to std::future, plus awaiters for std::future (plain and bounded)
//==========================================================================================================

#pragma once

#include <chrono>
#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace toolhost {
namespace async {

//==========================================================================================================
// Task<T>
// Purpose: Eagerly started coroutine whose result (or exception) is published through a std::future<T>.
// Usage:
//   Task<T> foo() { co_return value; }  ->  std::future<T> f = foo().toFuture();
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type {
        std::promise<T> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    struct promise_type {
        std::promise<void> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        void return_void() { promise.set_value(); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: co_await on a std::future<T>. Waiting happens on a detached helper thread which resumes the
//          coroutine; the value or stored exception is surfaced by await_resume via fut.get().
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

//==========================================================================================================
// BoundedWait<T>
// Purpose: co_await that waits at most `timeout` for a future owned by the caller. Resumes with the
//          resulting std::future_status; the caller decides whether to get() or abandon the future.
//==========================================================================================================
template <typename T>
class BoundedWait {
public:
    BoundedWait(std::future<T>& f, std::chrono::milliseconds timeout) : fut(f), timeout(timeout) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            status = fut.wait_for(timeout);
            h.resume();
        });
        waiter.detach();
    }

    std::future_status await_resume() const noexcept { return status; }

private:
    std::future<T>& fut;
    std::chrono::milliseconds timeout;
    std::future_status status{std::future_status::ready};
};

template <typename T>
inline BoundedWait<T> waitFor(std::future<T>& fut, std::chrono::milliseconds timeout) {
    return BoundedWait<T>(fut, timeout);
}

} // namespace async
} // namespace toolhost

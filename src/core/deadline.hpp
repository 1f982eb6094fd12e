#pragma once

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <fmt/format.h>
#include "constants.hpp"
#include "errors.hpp"

// Retry `attempt` until it yields a value or `timeout_ms` elapses.
// `attempt` returns std::nullopt for "not ready yet" (EAGAIN) and throws
// on hard failure. Expiry raises TimeoutError naming `what`.
template <typename Fn>
auto poll_until(int timeout_ms, const std::string& what, Fn&& attempt)
    -> typename decltype(attempt())::value_type {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto result = attempt();
        if (result.has_value()) return std::move(*result);
        if (std::chrono::steady_clock::now() >= deadline) {
            throw TimeoutError(fmt::format("{} timed out after {}ms", what, timeout_ms));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(EAGAIN_SLEEP_MS));
    }
}

// Wait for a shared future with a budget; the value (or stored exception) is
// returned (or rethrown) once ready.
template <typename T>
T await_with_timeout(const std::shared_future<T>& fut, int timeout_ms, const std::string& what) {
    if (fut.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        throw TimeoutError(fmt::format("{} timed out after {}ms", what, timeout_ms));
    }
    return fut.get();
}

#pragma once

#include "error_handler/error.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <random>
#include <string_view>
#include <thread>

namespace cupload::infra {
/*

auto res = infra::with_retry([&]() {
    return remote.append(request);
}, infra::RetryPolicy{ .max_attempts = 5 });


*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{2000};
};

// Отклонение в пределах [-d/4, +d/4], равномерно. Источник случайности передаётся явно.
template<std::uniform_random_bit_generator G>
[[nodiscard]] auto jitter(std::chrono::milliseconds d, G& rng) -> std::chrono::milliseconds
{
    std::uniform_real_distribution<double> dist(-0.25, 0.25);
    const double delta = static_cast<double>(d.count()) * dist(rng);
    return std::chrono::milliseconds(d.count() + std::llround(delta));
}

// Следующая задержка без jitter: удвоение с ограничением сверху
[[nodiscard]] inline auto next_backoff(std::chrono::milliseconds current,
                                       std::chrono::milliseconds max)
    -> std::chrono::milliseconds
{
    return std::min(current * 2, max);
}

// k-я задержка (k = 0, 1, ...): min(initial * 2^k, max)
[[nodiscard]] inline auto backoff_for_attempt(const RetryPolicy& policy, int k)
    -> std::chrono::milliseconds
{
    auto backoff = std::min(policy.initial_backoff, policy.max_backoff);
    for (int i = 0; i < k && backoff < policy.max_backoff; ++i) {
        backoff = next_backoff(backoff, policy.max_backoff);
    }
    return backoff;
}

[[nodiscard]] inline auto system_jitter(std::chrono::milliseconds d) -> std::chrono::milliseconds
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return jitter(d, rng);
}

[[nodiscard]] inline auto no_jitter(std::chrono::milliseconds d) -> std::chrono::milliseconds
{
    return d;
}

struct RetryContext {
    std::string_view operation = "remote call";
    std::function<void(std::chrono::milliseconds)> sleep =
        [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    std::function<std::chrono::milliseconds(std::chrono::milliseconds)> jitter = system_jitter;
};

/// Повторяет operation() пока не будет успеха.
///  - Transient: задержка jitter(backoff), затем backoff удваивается (до max_backoff);
///    после max_attempts подряд неудачных попыток возвращается последняя ошибка.
///  - RateLimited: ждём ровно retry_after и повторяем, попытка не расходуется.
///  - Остальные ошибки возвращаются сразу.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              const RetryContext& ctx = {})
    -> decltype(operation())
{
    auto backoff = std::min(policy.initial_backoff, policy.max_backoff);
    int failures = 0;

    for (;;) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        if (err.is_rate_limited()) {
            spdlog::warn("{}: rate-limited ({}), waiting {} seconds",
                         ctx.operation, err.message, err.retry_after.count());
            if (err.retry_after.count() > 0) {
                ctx.sleep(std::chrono::duration_cast<std::chrono::milliseconds>(err.retry_after));
            }
            continue;
        }

        if (!err.is_transient()) {
            return result;
        }

        if (++failures >= policy.max_attempts) {
            spdlog::error("Error calling {}: {}, failing.", ctx.operation, err.message);
            return result;
        }
        spdlog::warn("Error calling {}: {}, retrying.", ctx.operation, err.message);

        ctx.sleep(ctx.jitter(backoff));
        backoff = next_backoff(backoff, policy.max_backoff);
    }
}

} // namespace cupload::infra

#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>

namespace retry {

template <typename T>
struct Outcome {
    std::optional<T> value;      // 成功时的返回值
    std::string      lastError;  // 最后一次失败的原因
    int              attempts = 0;

    explicit operator bool() const { return value.has_value(); }
};

// 第 attempt 次（从 1 开始）失败后、睡眠前回调
using OnRetry = std::function<void(int attempt, const std::exception& e)>;

// 最多执行 maxRetries + 1 次；最后一次失败不再睡眠，直接返回失败结果
template <typename Fn>
auto call(Fn&& fn,
          int maxRetries,
          std::chrono::milliseconds delay,
          const OnRetry& onRetry = {}) -> Outcome<std::invoke_result_t<Fn&>>
{
    Outcome<std::invoke_result_t<Fn&>> out;
    const int total = maxRetries < 0 ? 1 : maxRetries + 1;
    for (int attempt = 1; attempt <= total; ++attempt) {
        out.attempts = attempt;
        try {
            out.value.emplace(fn());
            out.lastError.clear();
            return out;
        } catch (const std::exception& e) {
            out.lastError = e.what();
            if (attempt == total) break;
            if (onRetry) onRetry(attempt, e);
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
        }
    }
    return out;
}

} // namespace retry

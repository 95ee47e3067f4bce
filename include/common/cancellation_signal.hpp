#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// 一次性取消信号：既是 worker 的间隔睡眠，也是停止通道
class CancellationSignal {
public:
    using Duration = std::chrono::milliseconds;

    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&)            = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    void set();
    bool isSet() const;

    // 最多等待 timeout；返回 true 表示在超时前收到取消
    bool waitFor(Duration timeout);

private:
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    bool                    set_ = false;
};

#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <signal.h>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

/*==========================================================
 * 终止信号 -> 普通线程
 * 信号处理函数只往 self-pipe 写一个 int，真正的清理在监视线程里做，
 * 完成后恢复默认处理并把原信号重新发给自己
 *=========================================================*/
class SignalWatcher {
public:
    using Handler = std::function<void(int sig)>;

    static SignalWatcher& instance();

    ~SignalWatcher();
    SignalWatcher(const SignalWatcher&)            = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // 重复调用会替换 handler；返回 false 表示 sigaction 失败
    bool install(const std::vector<int>& signals, Handler handler);
    // 恢复之前的处理函数并停止监视线程
    void uninstall();

    bool installed() const { return installed_; }

private:
    SignalWatcher() = default;

    static void onSignal(int sig);
    void loop();

    std::mutex                     mtx_;
    Handler                        handler_;
    std::map<int, struct sigaction> previous_;
    std::thread                    thread_;
    int                            pipe_[2] = {-1, -1};
    std::atomic<bool>              installed_{false};
    std::atomic<bool>              fired_{false};
};

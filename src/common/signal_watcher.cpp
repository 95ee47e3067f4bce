#include "common/signal_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace {
// 信号处理函数里只能碰 async-signal-safe 的东西
std::atomic<int> g_write_fd{-1};
} // namespace

SignalWatcher& SignalWatcher::instance() {
    static SignalWatcher ins;
    return ins;
}

SignalWatcher::~SignalWatcher() { uninstall(); }

void SignalWatcher::onSignal(int sig) {
    const int saved = errno;
    const int fd = g_write_fd.load();
    if (fd >= 0) {
        const int s = sig;
        ssize_t n = ::write(fd, &s, sizeof(s));
        (void)n;
    }
    errno = saved;
}

bool SignalWatcher::install(const std::vector<int>& signals, Handler handler) {
    std::lock_guard lg(mtx_);
    handler_ = std::move(handler);

    if (!installed_) {
        if (::pipe2(pipe_, O_CLOEXEC) != 0) {
            spdlog::error("SignalWatcher: pipe2 failed: {}", std::strerror(errno));
            return false;
        }
        g_write_fd = pipe_[1];
        fired_     = false;
        thread_    = std::thread([this] { loop(); });
        installed_ = true;
    }

    bool ok = true;
    for (int sig : signals) {
        struct sigaction sa{};
        sa.sa_handler = &SignalWatcher::onSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;

        struct sigaction old{};
        if (sigaction(sig, &sa, &old) != 0) {
            spdlog::error("SignalWatcher: could not register handler for signal {}: {}",
                          sig, std::strerror(errno));
            ok = false;
            continue;
        }
        previous_.emplace(sig, old);   // 只记录第一次安装前的处理函数
    }
    if (ok) spdlog::debug("SignalWatcher: handlers registered for {} signal(s)", signals.size());
    return ok;
}

void SignalWatcher::uninstall() {
    std::thread th;
    {
        std::lock_guard lg(mtx_);
        if (!installed_) return;

        for (const auto& [sig, old] : previous_) {
            sigaction(sig, &old, nullptr);
        }
        previous_.clear();

        // 0 作为退出哨兵
        const int stop = 0;
        ssize_t n = ::write(pipe_[1], &stop, sizeof(stop));
        (void)n;
        th = std::move(thread_);
        installed_ = false;
    }

    if (th.joinable()) {
        if (th.get_id() == std::this_thread::get_id()) th.detach();
        else th.join();
    }

    std::lock_guard lg(mtx_);
    g_write_fd = -1;
    if (pipe_[0] >= 0) ::close(pipe_[0]);
    if (pipe_[1] >= 0) ::close(pipe_[1]);
    pipe_[0] = pipe_[1] = -1;
    handler_ = nullptr;
}

void SignalWatcher::loop() {
    const int read_fd = pipe_[0];
    for (;;) {
        int sig = 0;
        ssize_t n = ::read(read_fd, &sig, sizeof(sig));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(sig)) || sig == 0) break;

        // 只处理第一次收到的终止信号
        if (fired_.exchange(true)) continue;

        spdlog::warn("SignalWatcher: received signal {} ({}), running shutdown sequence",
                     sig, strsignal(sig));
        Handler handler;
        {
            std::lock_guard lg(mtx_);
            handler = handler_;
        }
        if (handler) {
            try {
                handler(sig);
            } catch (const std::exception& e) {
                spdlog::error("SignalWatcher: shutdown handler failed: {}", e.what());
            }
        }

        // 恢复默认处理并重新投递，让进程按正常路径终止
        struct sigaction dfl{};
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        sigaction(sig, &dfl, nullptr);
        spdlog::default_logger()->flush();
        ::kill(::getpid(), sig);
        break;
    }
}

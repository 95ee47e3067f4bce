// copy_manager.cpp
#include "shipper/copy_manager.hpp"

#include <csignal>
#include <future>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "common/copy_coordinator.hpp"
#include "common/signal_watcher.hpp"
#include "shipper/duplicate_detector.hpp"
#include "shipper/file_discovery.hpp"

using namespace std::chrono_literals;

CopyManager::CopyManager(bool enabled, FileAccessRegistry& files)
    : enabled_(enabled), engine_(tracker_, files)
{
    if (!enabled_) spdlog::info("CopyManager: file copying is disabled on this node");
}

CopyManager::~CopyManager()
{
    cleanup();
    // 工作线程引用着 engine_/tracker_/registry_，必须在成员析构前退出
    for (auto& t : stragglers_) {
        if (t.joinable()) t.join();
    }
    if (signalsInstalled_) SignalWatcher::instance().uninstall();
}

CopyManager& CopyManager::instance()
{
    // SignalWatcher 先构造，保证它比管理器晚析构
    SignalWatcher::instance();
    static CopyManager mgr(CopyCoordinator::instance().copyEnabled());
    static const bool installed = mgr.installSignalHandlers();
    (void)installed;
    return mgr;
}

bool CopyManager::installSignalHandlers()
{
    signalsInstalled_ = SignalWatcher::instance().install({SIGINT, SIGTERM}, [this](int sig) {
        spdlog::info("CopyManager: signal {} received, cleaning up copy operations", sig);
        cleanup();
    });
    return signalsInstalled_;
}

// ------------------------------------------------------------------
// 启动
void CopyManager::start(const ShipOptions& opt)
{
    if (opt.name.empty())
        throw std::invalid_argument("Copy operation name cannot be empty");
    if (registry_.contains(opt.name))
        throw std::invalid_argument(fmt::format("Copy operation '{}' already exists", opt.name));
    if (registry_.shuttingDown())
        throw std::invalid_argument("Cannot start copy operation: shutdown in progress");
    opt.validate();

    if (!enabled_) {
        spdlog::info("CopyManager: copy disabled, not starting copy operation '{}'", opt.name);
        return;
    }

    registry_.insert(opt, [this](const ShipOptions& o, CancellationSignal& s) { workerLoop(o, s); });
    spdlog::info("CopyManager: started copy operation '{}': {} -> {} every {} ms",
                 opt.name, fmt::join(opt.patterns, ", "), opt.destination, opt.interval.count());
}

// ------------------------------------------------------------------
// 工作线程
void CopyManager::workerLoop(const ShipOptions& opt, CancellationSignal& signal)
{
    spdlog::debug("CopyManager: worker for '{}' running", opt.name);
    while (!signal.isSet()) {
        try {
            runCycle(opt);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Error in copy cycle: {}", opt.name, e.what());
        }
        if (signal.waitFor(opt.interval)) break;
    }
    spdlog::debug("CopyManager: worker for '{}' exiting", opt.name);
}

void CopyManager::runCycle(const ShipOptions& opt)
{
    auto files = file_discovery::discover(opt.patterns);
    DuplicateDetector::report(opt.name, registry_.updateFileSet(opt.name, files));

    if (files.empty()) {
        spdlog::info("[{}] No files found matching patterns: {}", opt.name, fmt::join(opt.patterns, ", "));
        return;
    }

    auto report = engine_.copyFiles(files, opt);
    spdlog::debug("[{}] cycle done: {} ok, {} failed, {} bytes",
                  opt.name, report.succeeded, report.failed, report.bytes);
}

// ------------------------------------------------------------------
// 停止
bool CopyManager::stop(const std::string& name, Duration timeout)
{
    auto handle = registry_.requestStop(name);
    if (handle.exited.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("CopyManager: copy operation '{}' did not stop within {} ms", name, timeout.count());
        return false;
    }

    auto removed = registry_.remove(name);
    if (!removed) return true;      // 已被并发的 stop 移除
    if (removed->worker.joinable()) removed->worker.join();

    for (const auto& f : removed->unreferenced) tracker_.erase(f);
    spdlog::info("CopyManager: stopped copy operation '{}'", name);
    return true;
}

std::vector<std::string> CopyManager::stopAll(Duration timeout, bool verbose)
{
    auto names = registry_.names();

    // 先全部发出取消，再逐个等待
    for (const auto& name : names) {
        try {
            registry_.requestStop(name);
        } catch (const std::invalid_argument& e) {
            spdlog::debug("CopyManager: {}", e.what());
        }
    }

    std::vector<std::string> failed;
    for (const auto& name : names) {
        try {
            if (!stop(name, timeout)) failed.push_back(name);
        } catch (const std::invalid_argument& e) {
            spdlog::debug("CopyManager: {}", e.what());
        }
    }

    if (verbose) {
        if (failed.empty())
            spdlog::info("CopyManager: all {} copy operation(s) stopped", names.size());
        else
            spdlog::warn("CopyManager: failed to stop copy operation(s): {}", fmt::join(failed, ", "));
    }
    return failed;
}

std::vector<OperationInfo> CopyManager::list() const
{
    return registry_.list();
}

// ------------------------------------------------------------------
// 手动触发
void CopyManager::triggerNow()
{
    auto names = registry_.names();
    if (names.empty()) {
        spdlog::info("CopyManager: no copy operations to trigger");
        return;
    }
    triggerNow(names);
}

void CopyManager::triggerNow(const std::string& name)
{
    triggerNow(std::vector<std::string>{name});
}

void CopyManager::triggerNow(const std::vector<std::string>& names)
{
    if (registry_.empty()) {
        spdlog::info("CopyManager: no copy operations to trigger");
        return;
    }

    std::vector<ShipOptions> targets;
    targets.reserve(names.size());
    for (const auto& name : names) {
        auto opt = registry_.options(name);
        if (!opt) throw std::invalid_argument(fmt::format("Copy operation '{}' does not exist", name));
        targets.push_back(std::move(*opt));
    }

    for (const auto& opt : targets) {
        spdlog::info("[{}] Manually triggering copy", opt.name);
        try {
            runCycle(opt);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Manual trigger failed: {}", opt.name, e.what());
        }
    }
}

// ------------------------------------------------------------------
// 关闭
void CopyManager::cleanup(Duration timeout)
{
    std::call_once(cleanupOnce_, [&] { shutdown(timeout); });
}

void CopyManager::shutdown(Duration timeout)
{
    registry_.beginShutdown();
    if (!registry_.empty()) {
        spdlog::info("CopyManager: final copy before shutdown");
        try {
            triggerNow();
        } catch (const std::exception& e) {
            spdlog::error("CopyManager: final copy failed: {}", e.what());
        }
    }

    stopAll(timeout, true);

    auto leftover = registry_.clear();
    if (leftover.empty()) {
        tracker_.clear();
    } else {
        // 仍在运行的线程要靠 offset 避免重复追加，offset 留到析构
        spdlog::warn("CopyManager: {} worker thread(s) did not stop in time, joining them on destruction",
                     leftover.size());
        for (auto& t : leftover) stragglers_.push_back(std::move(t));
    }
    spdlog::info("CopyManager: cleanup complete");
}

// ------------------------------------------------------------------
// 配置与状态
std::size_t CopyManager::startFromConfig(const YAML::Node& operations, const YAML::Node& defaults)
{
    if (!operations || operations.IsNull()) {
        spdlog::info("CopyManager: no copy operations configured");
        return 0;
    }
    if (!operations.IsMap())
        throw std::runtime_error("CopyManager: 'operations' must be a mapping of name -> options");

    ShipOptions base;
    if (defaults && defaults.IsMap()) base = ShipOptions::fromYaml("defaults", defaults, base);

    std::size_t started = 0;
    for (const auto& kv : operations) {
        const auto name = kv.first.as<std::string>();
        try {
            start(ShipOptions::fromYaml(name, kv.second, base));
            if (registry_.contains(name)) ++started;
        } catch (const std::exception& e) {
            spdlog::error("CopyManager: cannot start copy operation '{}': {}", name, e.what());
        }
    }
    spdlog::info("CopyManager: started {} of {} configured copy operation(s)", started, operations.size());
    return started;
}

nlohmann::json CopyManager::snapshot() const
{
    nlohmann::json j;
    j["copy_enabled"]  = enabled_;
    j["shutting_down"] = registry_.shuttingDown();
    j["operations"]    = nlohmann::json::array();
    for (const auto& info : registry_.list()) {
        nlohmann::json op = {
            {"name", info.name},
            {"thread_id", info.threadId},
            {"thread_name", info.threadName},
            {"is_alive", info.isAlive},
            {"is_background", info.isBackground},
        };
        if (auto opt = registry_.options(info.name)) {
            op["patterns"]     = opt->patterns;
            op["destination"]  = opt->destination;
            op["interval_sec"] = opt->interval.count() / 1000.0;
        }
        op["files"] = registry_.fileSet(info.name);
        j["operations"].push_back(std::move(op));
    }
    return j;
}

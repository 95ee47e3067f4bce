// copy_manager.hpp
#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "shipper/offset_tracker.hpp"
#include "shipper/operation_registry.hpp"
#include "shipper/ship_options.hpp"
#include "shipper/transfer_engine.hpp"

/*==========================================================
 * 拷贝作业的生命周期：start / stop / triggerNow / cleanup
 * 每个作业一个线程，周期为 发现文件 -> 重叠检查 -> 增量拷贝 -> 等待
 *=========================================================*/
class CopyManager {
public:
    using Duration = std::chrono::milliseconds;
    static constexpr Duration DEFAULT_TIMEOUT = std::chrono::seconds(60);

    // enabled=false 时 start() 只打日志不启动
    explicit CopyManager(bool enabled,
                         FileAccessRegistry& files = FileAccessRegistry::instance());
    ~CopyManager();

    CopyManager(const CopyManager&)            = delete;
    CopyManager& operator=(const CopyManager&) = delete;

    // 进程级实例：开关取自 CopyCoordinator，并接管 SIGINT/SIGTERM
    static CopyManager& instance();

    // 参数非法、重名或正在关闭时抛 std::invalid_argument
    void start(const ShipOptions& opt);

    // 超时返回 false 且不改动任何状态；未知名称抛 std::invalid_argument
    bool stop(const std::string& name, Duration timeout = DEFAULT_TIMEOUT);

    // 返回未能按时停止的作业名
    std::vector<std::string> stopAll(Duration timeout = DEFAULT_TIMEOUT, bool verbose = false);

    std::vector<OperationInfo> list() const;

    // 在调用线程上同步跑一个周期；名称先全部校验，任一未知则什么都不做
    void triggerNow();
    void triggerNow(const std::string& name);
    void triggerNow(const std::vector<std::string>& names);

    // 最后一次 flush 后停止全部作业；只执行一次，并发的调用者等到它完成才返回
    // 超时未退出的工作线程留到析构时 join
    void cleanup(Duration timeout = DEFAULT_TIMEOUT);

    // operations: name -> 作业参数映射；defaults 提供缺省值。返回实际启动的个数
    std::size_t startFromConfig(const YAML::Node& operations, const YAML::Node& defaults = YAML::Node());

    nlohmann::json snapshot() const;

    bool installSignalHandlers();

    bool isEnabled() const { return enabled_; }
    OffsetTracker& offsets() { return tracker_; }

private:
    void workerLoop(const ShipOptions& opt, CancellationSignal& signal);
    void runCycle(const ShipOptions& opt);
    void shutdown(Duration timeout);

    const bool        enabled_;
    OffsetTracker     tracker_;
    TransferEngine    engine_;
    OperationRegistry registry_;
    std::once_flag           cleanupOnce_;
    std::vector<std::thread> stragglers_;        // cleanup 超时的线程，析构时 join
    bool                     signalsInstalled_ = false;
};

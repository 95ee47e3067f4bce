// operation_registry.hpp
#pragma once
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/cancellation_signal.hpp"
#include "shipper/duplicate_detector.hpp"
#include "shipper/ship_options.hpp"

// list() 返回的条目
struct OperationInfo {
    std::string name;
    std::string threadId;
    std::string threadName;
    bool        isAlive      = false;
    bool        isBackground = false;
};

/*----------------------------------------------------------
 * 作业表：参数、取消信号、工作线程、当前文件集合
 * 所有字段都在同一把锁（operations lock）下读写，
 * 持锁期间不做任何文件 I/O
 *--------------------------------------------------------*/
class OperationRegistry {
public:
    using Worker = std::function<void(const ShipOptions&, CancellationSignal&)>;

    // 等待停止所需的句柄
    struct StopHandle {
        std::shared_future<void> exited;
    };

    // 从作业表中移出的结果，由调用方在锁外 join
    struct Removed {
        std::thread           worker;
        std::set<std::string> unreferenced;   // 不再被任何作业引用的文件
    };

    OperationRegistry() = default;
    ~OperationRegistry();

    OperationRegistry(const OperationRegistry&)            = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    // 锁内再次检查重名与关闭状态，然后登记并启动工作线程
    void insert(const ShipOptions& opt, Worker body);

    bool contains(const std::string& name) const;
    bool empty() const;
    std::vector<std::string> names() const;
    std::optional<ShipOptions> options(const std::string& name) const;

    // 与其他作业的快照比较后替换本作业的快照；作业已不存在时忽略
    std::vector<FileOverlap> updateFileSet(const std::string& name, const std::set<std::string>& files);
    std::set<std::string> fileSet(const std::string& name) const;

    // 置取消信号；未知名称抛 std::invalid_argument
    StopHandle requestStop(const std::string& name);

    // 线程已退出后调用：移出作业并计算可清理的 offset 条目
    std::optional<Removed> remove(const std::string& name);

    std::vector<OperationInfo> list() const;

    // 单向：一旦进入关闭，insert 永远失败
    void beginShutdown();
    bool shuttingDown() const;

    // 移出全部作业（不 join），返回仍持有的线程
    std::vector<std::thread> clear();

private:
    struct Operation {
        ShipOptions                         options;
        std::shared_ptr<CancellationSignal> signal;
        std::thread                         worker;
        std::shared_future<void>            exited;
        std::string                         threadId;
    };

    static bool isAlive(const Operation& op);

    mutable std::mutex               mtx_;
    std::map<std::string, Operation> ops_;
    DuplicateDetector::Snapshots     fileSets_;
    bool                             shutdown_ = false;
};

// operation_registry.cpp
#include "shipper/operation_registry.hpp"

#include <pthread.h>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t THREAD_NAME_MAX = 15;   // pthread 限制 16 字节含结尾 0

std::string threadNameFor(const std::string& name) {
    auto n = "ship-" + name;
    if (n.size() > THREAD_NAME_MAX) n.resize(THREAD_NAME_MAX);
    return n;
}

} // namespace

OperationRegistry::~OperationRegistry()
{
    // clear() 已置取消信号
    for (auto& t : clear()) {
        if (t.joinable()) t.join();
    }
}

bool OperationRegistry::isAlive(const Operation& op)
{
    return op.exited.valid() &&
           op.exited.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

void OperationRegistry::insert(const ShipOptions& opt, Worker body)
{
    std::lock_guard lk(mtx_);
    if (ops_.count(opt.name))
        throw std::invalid_argument(fmt::format("Copy operation '{}' already exists", opt.name));
    if (shutdown_)
        throw std::invalid_argument("Cannot start copy operation: shutdown in progress");

    Operation op;
    op.options = opt;
    op.signal  = std::make_shared<CancellationSignal>();

    std::promise<void> exited;
    op.exited = exited.get_future().share();

    op.worker = std::thread(
        [body = std::move(body), options = opt, signal = op.signal, p = std::move(exited)]() mutable {
            // 线程完全退出（含 thread_local 析构）后 future 才就绪
            p.set_value_at_thread_exit();
            pthread_setname_np(pthread_self(), threadNameFor(options.name).c_str());
            body(options, *signal);
        });

    std::ostringstream id;
    id << op.worker.get_id();
    op.threadId = id.str();

    fileSets_[opt.name] = {};
    ops_.emplace(opt.name, std::move(op));
}

bool OperationRegistry::contains(const std::string& name) const
{
    std::lock_guard lk(mtx_);
    return ops_.count(name) > 0;
}

bool OperationRegistry::empty() const
{
    std::lock_guard lk(mtx_);
    return ops_.empty();
}

std::vector<std::string> OperationRegistry::names() const
{
    std::lock_guard lk(mtx_);
    std::vector<std::string> out;
    out.reserve(ops_.size());
    for (const auto& [name, _] : ops_) out.push_back(name);
    return out;
}

std::optional<ShipOptions> OperationRegistry::options(const std::string& name) const
{
    std::lock_guard lk(mtx_);
    auto it = ops_.find(name);
    if (it == ops_.end()) return std::nullopt;
    return it->second.options;
}

std::vector<FileOverlap> OperationRegistry::updateFileSet(const std::string& name,
                                                          const std::set<std::string>& files)
{
    std::lock_guard lk(mtx_);
    if (!ops_.count(name)) return {};
    auto overlaps = DuplicateDetector::findOverlaps(name, files, fileSets_);
    fileSets_[name] = files;
    return overlaps;
}

std::set<std::string> OperationRegistry::fileSet(const std::string& name) const
{
    std::lock_guard lk(mtx_);
    auto it = fileSets_.find(name);
    if (it == fileSets_.end()) return {};
    return it->second;
}

OperationRegistry::StopHandle OperationRegistry::requestStop(const std::string& name)
{
    std::lock_guard lk(mtx_);
    auto it = ops_.find(name);
    if (it == ops_.end())
        throw std::invalid_argument(fmt::format("Copy operation '{}' does not exist", name));
    it->second.signal->set();
    return StopHandle{it->second.exited};
}

std::optional<OperationRegistry::Removed> OperationRegistry::remove(const std::string& name)
{
    std::lock_guard lk(mtx_);
    auto it = ops_.find(name);
    if (it == ops_.end()) return std::nullopt;

    Removed out;
    out.worker = std::move(it->second.worker);
    ops_.erase(it);

    auto fs = fileSets_.find(name);
    if (fs != fileSets_.end()) {
        out.unreferenced = std::move(fs->second);
        fileSets_.erase(fs);
    }
    for (const auto& [_, files] : fileSets_) {
        for (const auto& f : files) out.unreferenced.erase(f);
        if (out.unreferenced.empty()) break;
    }
    return out;
}

std::vector<OperationInfo> OperationRegistry::list() const
{
    std::lock_guard lk(mtx_);
    std::vector<OperationInfo> out;
    out.reserve(ops_.size());
    for (const auto& [name, op] : ops_) {
        out.push_back(OperationInfo{
            .name         = name,
            .threadId     = op.threadId,
            .threadName   = threadNameFor(name),
            .isAlive      = isAlive(op),
            .isBackground = false,
        });
    }
    return out;
}

void OperationRegistry::beginShutdown()
{
    std::lock_guard lk(mtx_);
    shutdown_ = true;
}

bool OperationRegistry::shuttingDown() const
{
    std::lock_guard lk(mtx_);
    return shutdown_;
}

std::vector<std::thread> OperationRegistry::clear()
{
    std::lock_guard lk(mtx_);
    std::vector<std::thread> out;
    for (auto& [name, op] : ops_) {
        op.signal->set();
        if (op.worker.joinable()) out.push_back(std::move(op.worker));
    }
    ops_.clear();
    fileSets_.clear();
    return out;
}

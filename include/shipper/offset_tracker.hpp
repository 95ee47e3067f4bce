#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

/*----------------------------------------------------------
 * 每个源文件已拷贝到的位置（进程内共享，键为源文件绝对路径）
 * advance() 在锁内认领 [offset, size)，锁外拷贝，再回到锁内提交
 * 同一文件正在被拷贝时，后到者直接返回 0，不会重复追加
 *--------------------------------------------------------*/
class OffsetTracker {
public:
    struct Entry {
        std::uint64_t offset   = 0;   // 已拷贝字节
        std::uint64_t lastSize = 0;   // 上次观察到的文件大小
    };

    // [from, to) 区间的实际拷贝，抛异常则 offset 不变
    using CopyRange = std::function<void(std::uint64_t from, std::uint64_t to)>;

    OffsetTracker() = default;
    OffsetTracker(const OffsetTracker&)            = delete;
    OffsetTracker& operator=(const OffsetTracker&) = delete;

    // 返回本次推进的字节数；文件变小视为轮转/截断，从 0 重新拷贝
    // copyRange 在锁外执行，不同文件的拷贝互不阻塞
    std::uint64_t advance(const std::string& path, std::uint64_t currentSize, const CopyRange& copyRange);

    std::optional<Entry> get(const std::string& path) const;
    void erase(const std::string& path);
    void clear();
    std::size_t size() const;

private:
    // 对 inFlight_ 中一个路径的占用，未提交就析构时放弃占用
    class Claim {
    public:
        Claim(OffsetTracker& owner, std::string path) : owner_(owner), path_(std::move(path)) {}
        ~Claim();
        Claim(const Claim&)            = delete;
        Claim& operator=(const Claim&) = delete;

        void commit(const Entry& entry);

    private:
        OffsetTracker& owner_;
        std::string    path_;
        bool           done_ = false;
    };

    mutable std::mutex                     mtx_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_set<std::string>        inFlight_;   // 正在拷贝的路径
};

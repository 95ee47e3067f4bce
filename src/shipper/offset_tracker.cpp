#include "shipper/offset_tracker.hpp"

#include <spdlog/spdlog.h>

OffsetTracker::Claim::~Claim()
{
    if (done_) return;
    std::lock_guard lk(owner_.mtx_);
    owner_.inFlight_.erase(path_);
}

void OffsetTracker::Claim::commit(const Entry& entry)
{
    std::lock_guard lk(owner_.mtx_);
    owner_.entries_[path_] = entry;
    owner_.inFlight_.erase(path_);
    done_ = true;
}

std::uint64_t OffsetTracker::advance(const std::string& path,
                                     std::uint64_t currentSize,
                                     const CopyRange& copyRange)
{
    std::uint64_t from = 0;
    {
        std::lock_guard lk(mtx_);
        if (inFlight_.count(path)) {
            spdlog::debug("OffsetTracker: {} is being copied by another operation, skipping", path);
            return 0;
        }

        Entry cur;
        auto it = entries_.find(path);
        if (it != entries_.end()) cur = it->second;

        if (currentSize < cur.lastSize) {
            spdlog::info("OffsetTracker: {} shrank from {} to {} bytes, assuming rotation/truncation",
                         path, cur.lastSize, currentSize);
            cur.offset = 0;
        }
        if (cur.offset > currentSize) cur.offset = 0;
        if (cur.offset == currentSize) {
            if (it != entries_.end()) it->second = Entry{currentSize, currentSize};
            return 0;
        }
        from = cur.offset;
        inFlight_.insert(path);
    }

    Claim claim(*this, path);
    copyRange(from, currentSize);
    claim.commit(Entry{currentSize, currentSize});
    return currentSize - from;
}

std::optional<OffsetTracker::Entry> OffsetTracker::get(const std::string& path) const
{
    std::lock_guard lk(mtx_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void OffsetTracker::erase(const std::string& path)
{
    std::lock_guard lk(mtx_);
    entries_.erase(path);
}

void OffsetTracker::clear()
{
    std::lock_guard lk(mtx_);
    entries_.clear();
}

std::size_t OffsetTracker::size() const
{
    std::lock_guard lk(mtx_);
    return entries_.size();
}

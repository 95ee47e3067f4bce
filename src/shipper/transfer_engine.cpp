#include "shipper/transfer_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "common/retry.hpp"

namespace fs = std::filesystem;

namespace {

std::string joinPath(const std::string& root, const std::string& rel) {
    if (root.empty()) return rel;
    if (root.back() == '/') return root + rel;
    return root + "/" + rel;
}

std::string parentOf(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return {};
    // webhdfs://host 本身不是目录
    if (path.compare(pos - 1, 2, "//") == 0) return {};
    return path.substr(0, pos);
}

} // namespace

TransferEngine::TransferEngine(OffsetTracker& tracker, FileAccessRegistry& registry)
    : tracker_(tracker), registry_(registry) {}

/* ---------- 目标路径 ---------- */
std::string TransferEngine::destinationFor(const std::string& file, const ShipOptions& opt)
{
    const fs::path src = fs::absolute(file).lexically_normal();
    if (opt.preserveStructure && opt.rootDir) {
        const fs::path root = fs::absolute(*opt.rootDir).lexically_normal();
        auto rel = src.lexically_relative(root);
        if (!rel.empty() && rel.begin()->string() != "..")
            return joinPath(opt.destination, rel.string());
        spdlog::warn("TransferEngine: {} is outside root_dir {}, using file name only",
                     src.string(), root.string());
    }
    return joinPath(opt.destination, src.filename().string());
}

/* ---------- 单文件增量拷贝 ---------- */
std::uint64_t TransferEngine::incrementalCopy(const std::string& localFile, const std::string& destPath)
{
    auto dst = registry_.resolve(destPath);
    if (!dst->exists(destPath)) {
        spdlog::debug("TransferEngine: destination {} does not exist, skipping {}", destPath, localFile);
        return 0;
    }

    auto src = registry_.resolve(localFile);
    std::optional<FileStat> st;
    try {
        st = src->stat(localFile);
    } catch (const std::exception& e) {
        spdlog::debug("TransferEngine: stat {} threw: {}", localFile, e.what());
    }
    if (!st) {
        spdlog::warn("TransferEngine: Could not get file info for {}", localFile);
        tracker_.erase(localFile);
        return 0;
    }

    return tracker_.advance(localFile, st->size, [&](std::uint64_t from, std::uint64_t to) {
        auto reader = src->openForRandomRead(localFile);
        auto writer = dst->openForAppend(destPath);
        reader->seek(from);
        std::uint64_t pos = from;
        while (pos < to) {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(CHUNK_SIZE, to - pos));
            auto chunk = reader->readUpTo(want);
            if (chunk.size() != want) {
                throw std::runtime_error(fmt::format("short read on {}: wanted {} bytes at {}, got {}",
                                                     localFile, want, pos, chunk.size()));
            }
            writer->write(chunk.data(), chunk.size());
            pos += chunk.size();
        }
        writer->flush();
        spdlog::debug("TransferEngine: {} [{}, {}) -> {}", localFile, from, to, destPath);
    });
}

/* ---------- 目标目录与空文件 ---------- */
void TransferEngine::prepareDestination(const std::string& destPath)
{
    try {
        auto dst = registry_.resolve(destPath);
        auto parent = parentOf(destPath);
        if (!parent.empty()) dst->makeDirs(parent, true);
        dst->createFile(destPath);
    } catch (const std::exception& e) {
        spdlog::warn("TransferEngine: cannot prepare destination {}: {}", destPath, e.what());
    }
}

/* ---------- 一批文件 ---------- */
CopyReport TransferEngine::copyFiles(const std::set<std::string>& files, const ShipOptions& opt)
{
    CopyReport report;
    for (const auto& file : files) {
        const auto dest = destinationFor(file, opt);
        if (opt.createDestDirs) prepareDestination(dest);

        auto outcome = retry::call(
            [&] { return incrementalCopy(file, dest); },
            opt.maxRetries, opt.retryDelay,
            [&](int attempt, const std::exception& e) {
                spdlog::warn("[{}] Attempt {} failed for {}: {}. Retrying in {} ms...",
                             opt.name, attempt, file, e.what(), opt.retryDelay.count());
            });

        if (outcome) {
            ++report.succeeded;
            report.bytes += *outcome.value;
            if (*outcome.value > 0)
                spdlog::info("[{}] Copied {} bytes from {} to {}", opt.name, *outcome.value, file, dest);
        } else {
            ++report.failed;
            spdlog::error("[{}] Failed to copy {} after {} attempts: {}",
                          opt.name, file, outcome.attempts, outcome.lastError);
        }
    }
    return report;
}

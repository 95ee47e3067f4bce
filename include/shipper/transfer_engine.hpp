#pragma once
#include <cstdint>
#include <set>
#include <string>
#include "fileio/file_access_registry.hpp"
#include "shipper/offset_tracker.hpp"
#include "shipper/ship_options.hpp"

// 一个周期内的拷贝结果
struct CopyReport {
    std::size_t   succeeded = 0;
    std::size_t   failed    = 0;
    std::uint64_t bytes     = 0;
};

/*----------------------------------------------------------
 * 增量拷贝：只把源文件新增的字节追加到目标文件
 * 源文件和目标路径都经 FileAccessRegistry 按 scheme 选后端
 *--------------------------------------------------------*/
class TransferEngine {
public:
    static constexpr std::size_t CHUNK_SIZE = 1 << 20;   // 单次读写 1 MiB

    explicit TransferEngine(OffsetTracker& tracker,
                            FileAccessRegistry& registry = FileAccessRegistry::instance());

    // 单次尝试；I/O 失败抛异常且不推进 offset。目标不存在或源文件 stat 失败返回 0
    std::uint64_t incrementalCopy(const std::string& localFile, const std::string& destPath);

    // 对每个文件：按需建目录/空文件，然后带重试地 incrementalCopy；单个文件失败不影响其他文件
    CopyReport copyFiles(const std::set<std::string>& files, const ShipOptions& opt);

    // preserveStructure 时保留相对 rootDir 的路径，否则只取文件名
    static std::string destinationFor(const std::string& file, const ShipOptions& opt);

private:
    void prepareDestination(const std::string& destPath);

    OffsetTracker&      tracker_;
    FileAccessRegistry& registry_;
};

// file_access.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FileStat {
    std::uint64_t                         size = 0;
    std::chrono::system_clock::time_point modifiedTime{};
    bool                                  isRegular = true;
};

using Bytes = std::vector<char>;

class RandomReader {
public:
    virtual ~RandomReader() = default;
    virtual void  seek(std::uint64_t offset)  = 0;
    // 读到 EOF 时返回的字节数可能少于 n
    virtual Bytes readUpTo(std::size_t n)     = 0;
};

class AppendWriter {
public:
    virtual ~AppendWriter() = default;
    virtual void write(const char* data, std::size_t len) = 0;
    virtual void flush() {}
};

/*----------------------------------------------------------
 * 文件访问协议：本地/远端后端统一实现
 * I/O 失败一律抛 std::runtime_error，stat 找不到文件返回 nullopt
 *--------------------------------------------------------*/
class FileAccess {
public:
    virtual ~FileAccess() = default;

    virtual bool exists(const std::string& path)                              = 0;
    virtual std::optional<FileStat> stat(const std::string& path)             = 0;
    virtual std::unique_ptr<RandomReader> openForRandomRead(const std::string& path) = 0;
    virtual std::unique_ptr<AppendWriter> openForAppend(const std::string& path)     = 0;
    virtual void makeDirs(const std::string& path, bool existOk)              = 0;
    // 创建空文件，已存在时不做任何事
    virtual void createFile(const std::string& path)                          = 0;
};

#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <string>
#include "fileio/file_access.hpp"

// 本地文件系统后端，接受普通路径或 file:// URL
class LocalFileAccess : public FileAccess {
public:
    bool exists(const std::string& path) override;
    std::optional<FileStat> stat(const std::string& path) override;
    std::unique_ptr<RandomReader> openForRandomRead(const std::string& path) override;
    std::unique_ptr<AppendWriter> openForAppend(const std::string& path) override;
    void makeDirs(const std::string& path, bool existOk) override;
    void createFile(const std::string& path) override;

    // 去掉 file:// 前缀
    static std::string toLocalPath(const std::string& path);
};

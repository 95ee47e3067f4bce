// file_access_registry.hpp
#pragma once
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "fileio/file_access.hpp"

// 按 URL scheme 选择后端；没有 scheme 的路径走本地文件系统
class FileAccessRegistry {
public:
    using Factory = std::function<std::shared_ptr<FileAccess>()>;

    static constexpr const char* LOCAL_SCHEME = "file";

    // 构造时登记内置后端（file / webhdfs）
    FileAccessRegistry();

    // 单例（可选）；测试可自行构造
    static FileAccessRegistry& instance();

    // 注册模板：把任意 FileAccess 实现登记到 scheme 名下
    template <typename T>
    void registerScheme(std::string scheme) {
        registerFactory(std::move(scheme), [] { return std::make_shared<T>(); });
    }

    // 同名覆盖，已缓存的实例一并作废
    void registerFactory(std::string scheme, Factory factory);
    bool unregisterScheme(const std::string& scheme);

    // 未知 scheme 抛 std::runtime_error
    std::shared_ptr<FileAccess> resolve(const std::string& path) const;

    // 列举已注册 scheme（调试用）
    std::vector<std::string> list() const;

    // "webhdfs://nn:9870/x" -> "webhdfs"；普通路径返回空串
    static std::string schemeOf(const std::string& path);

private:
    mutable std::shared_mutex                                            mtx_;
    std::unordered_map<std::string, Factory>                             factories_;
    mutable std::unordered_map<std::string, std::shared_ptr<FileAccess>> instances_;
};

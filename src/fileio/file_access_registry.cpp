// file_access_registry.cpp
#include "fileio/file_access_registry.hpp"
#include "fileio/local_file_access.hpp"
#include "fileio/webhdfs_file_access.hpp"

#include <cctype>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

FileAccessRegistry::FileAccessRegistry() {
    registerScheme<LocalFileAccess>(LOCAL_SCHEME);
    registerScheme<WebHdfsFileAccess>(WebHdfsFileAccess::SCHEME);
}

FileAccessRegistry& FileAccessRegistry::instance() {
    static FileAccessRegistry reg;
    return reg;
}

void FileAccessRegistry::registerFactory(std::string scheme, Factory factory) {
    std::unique_lock lg(mtx_);
    instances_.erase(scheme);
    factories_[std::move(scheme)] = std::move(factory);
}

bool FileAccessRegistry::unregisterScheme(const std::string& scheme) {
    std::unique_lock lg(mtx_);
    instances_.erase(scheme);
    return factories_.erase(scheme) > 0;
}

std::shared_ptr<FileAccess> FileAccessRegistry::resolve(const std::string& path) const {
    auto scheme = schemeOf(path);
    if (scheme.empty()) scheme = LOCAL_SCHEME;

    {
        std::shared_lock lg(mtx_);
        auto it = instances_.find(scheme);
        if (it != instances_.end()) return it->second;
    }

    std::unique_lock lg(mtx_);
    auto cached = instances_.find(scheme);          // 双重检查
    if (cached != instances_.end()) return cached->second;

    auto it = factories_.find(scheme);
    if (it == factories_.end()) {
        spdlog::error("FileAccessRegistry: no backend registered for scheme '{}' ({})", scheme, path);
        throw std::runtime_error("FileAccessRegistry: unsupported scheme '" + scheme + "'");
    }
    auto impl = it->second();
    if (!impl) throw std::runtime_error("FileAccessRegistry: factory for '" + scheme + "' returned null");
    instances_.emplace(scheme, impl);
    return impl;
}

std::vector<std::string> FileAccessRegistry::list() const {
    std::shared_lock lg(mtx_);
    std::vector<std::string> out;
    for (const auto& [k, _] : factories_) out.push_back(k);
    return out;
}

std::string FileAccessRegistry::schemeOf(const std::string& path) {
    const auto pos = path.find("://");
    if (pos == std::string::npos || pos == 0) return {};
    for (std::size_t i = 0; i < pos; ++i) {
        const char c = path[i];
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        if (!ok) return {};
    }
    return path.substr(0, pos);
}

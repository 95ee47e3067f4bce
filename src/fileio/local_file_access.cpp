#include "fileio/local_file_access.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* FILE_PREFIX = "file://";

std::runtime_error ioError(const std::string& what, const std::string& path) {
    return std::runtime_error(fmt::format("LocalFileAccess: {} {}: {}", what, path, std::strerror(errno)));
}

// fd 的 RAII 封装
class Fd {
public:
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { if (fd_ >= 0) ::close(fd_); }
    Fd(const Fd&)            = delete;
    Fd& operator=(const Fd&) = delete;
    int get() const { return fd_; }
private:
    int fd_;
};

class LocalReader : public RandomReader {
public:
    LocalReader(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    void seek(std::uint64_t offset) override {
        if (::lseek(fd_.get(), static_cast<off_t>(offset), SEEK_SET) < 0)
            throw ioError("cannot seek", path_);
    }

    Bytes readUpTo(std::size_t n) override {
        Bytes buf(n);
        std::size_t got = 0;
        while (got < n) {
            ssize_t r = ::read(fd_.get(), buf.data() + got, n - got);
            if (r < 0) {
                if (errno == EINTR) continue;
                throw ioError("cannot read", path_);
            }
            if (r == 0) break;               // EOF
            got += static_cast<std::size_t>(r);
        }
        buf.resize(got);
        return buf;
    }

private:
    std::string path_;
    Fd          fd_;
};

class LocalWriter : public AppendWriter {
public:
    LocalWriter(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    void write(const char* data, std::size_t len) override {
        std::size_t done = 0;
        while (done < len) {
            ssize_t w = ::write(fd_.get(), data + done, len - done);
            if (w < 0) {
                if (errno == EINTR) continue;
                throw ioError("cannot append to", path_);
            }
            done += static_cast<std::size_t>(w);
        }
    }

    void flush() override {
        if (::fsync(fd_.get()) != 0 && errno != EINVAL)
            throw ioError("cannot fsync", path_);
    }

private:
    std::string path_;
    Fd          fd_;
};

} // namespace

std::string LocalFileAccess::toLocalPath(const std::string& path) {
    if (path.rfind(FILE_PREFIX, 0) == 0) return path.substr(std::strlen(FILE_PREFIX));
    return path;
}

bool LocalFileAccess::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(toLocalPath(path), ec);
}

std::optional<FileStat> LocalFileAccess::stat(const std::string& path) {
    const auto local = toLocalPath(path);
    struct ::stat st{};
    if (::stat(local.c_str(), &st) != 0) {
        spdlog::debug("LocalFileAccess: stat {} failed: {}", local, std::strerror(errno));
        return std::nullopt;
    }
    FileStat out;
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.modifiedTime = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    out.isRegular = S_ISREG(st.st_mode);
    return out;
}

std::unique_ptr<RandomReader> LocalFileAccess::openForRandomRead(const std::string& path) {
    const auto local = toLocalPath(path);
    int fd = ::open(local.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw ioError("cannot open", local);
    return std::make_unique<LocalReader>(local, fd);
}

std::unique_ptr<AppendWriter> LocalFileAccess::openForAppend(const std::string& path) {
    const auto local = toLocalPath(path);
    int fd = ::open(local.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw ioError("cannot open for append", local);
    return std::make_unique<LocalWriter>(local, fd);
}

void LocalFileAccess::makeDirs(const std::string& path, bool existOk) {
    const auto local = toLocalPath(path);
    if (local.empty()) return;
    std::error_code ec;
    if (fs::exists(local, ec)) {
        if (!existOk)
            throw std::runtime_error(fmt::format("LocalFileAccess: directory already exists: {}", local));
        if (!fs::is_directory(local, ec))
            throw std::runtime_error(fmt::format("LocalFileAccess: not a directory: {}", local));
        return;
    }
    fs::create_directories(local, ec);
    if (ec)
        throw std::runtime_error(fmt::format("LocalFileAccess: cannot create {}: {}", local, ec.message()));
}

void LocalFileAccess::createFile(const std::string& path) {
    const auto local = toLocalPath(path);
    int fd = ::open(local.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw ioError("cannot create", local);
    ::close(fd);
}

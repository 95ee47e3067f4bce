// webhdfs_file_access.hpp
#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <string>
#include "fileio/file_access.hpp"

/*----------------------------------------------------------
 * HDFS 后端（WebHDFS REST），URL 形如 webhdfs://namenode:9870/logs/app
 * 每次请求使用独立的 curl easy handle，可被多个 worker 线程同时调用
 *--------------------------------------------------------*/
class WebHdfsFileAccess : public FileAccess {
public:
    static constexpr const char* SCHEME       = "webhdfs";
    static constexpr int         DEFAULT_PORT = 9870;

    struct options
    {
        std::string user;              // 为空时读取 HADOOP_USER_NAME
        long        timeout_sec = 30;
        bool        use_tls     = false;
    };

    struct Location
    {
        std::string host;
        int         port = DEFAULT_PORT;
        std::string path;              // 以 / 开头
    };

    WebHdfsFileAccess();
    explicit WebHdfsFileAccess(options opt);

    bool exists(const std::string& path) override;
    std::optional<FileStat> stat(const std::string& path) override;
    std::unique_ptr<RandomReader> openForRandomRead(const std::string& path) override;
    std::unique_ptr<AppendWriter> openForAppend(const std::string& path) override;
    void makeDirs(const std::string& path, bool existOk) override;
    void createFile(const std::string& path) override;

    // webhdfs://host:port/path 解析，格式不对抛 std::invalid_argument
    static Location parse(const std::string& url);

    // 拼出 REST 地址：http://host:port/webhdfs/v1/<path>?op=OP[&user.name=u][&extra]
    std::string restUrl(const std::string& url,
                        const std::string& op,
                        const std::string& extraQuery = "") const;

    struct Response
    {
        long        code = 0;
        std::string body;
    };

    // method: GET / PUT / POST；data 非空时作为请求体
    Response request(const std::string& method,
                     const std::string& url,
                     const char* data = nullptr,
                     std::size_t len = 0) const;

private:
    static std::string encodePath(const std::string& path);
    [[noreturn]] static void throwRemote(const Response& resp, const std::string& what);

    options opt_;
};

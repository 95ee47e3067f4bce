// webhdfs_file_access.cpp
#include "fileio/webhdfs_file_access.hpp"

#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

size_t collect_cb(char* ptr, size_t size, size_t n, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * n);
    return size * n;
}

void globalInitOnce() {
    static std::once_flag once;
    std::call_once(once, [] {
        spdlog::debug("WebHdfsFileAccess: initializing curl...");
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

// curl easy handle 的 RAII 封装
struct CurlHandle {
    CURL* h = curl_easy_init();
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct CurlHeaders {
    curl_slist* list = nullptr;
    ~CurlHeaders() { if (list) curl_slist_free_all(list); }
};

/* ---------- 远端读 ---------- */
class WebHdfsReader : public RandomReader {
public:
    WebHdfsReader(const WebHdfsFileAccess& owner, std::string url)
        : owner_(owner), url_(std::move(url)) {}

    void seek(std::uint64_t offset) override { offset_ = offset; }

    Bytes readUpTo(std::size_t n) override {
        if (n == 0) return {};
        auto rest = owner_.restUrl(url_, "OPEN", fmt::format("offset={}&length={}", offset_, n));
        auto resp = owner_.request("GET", rest);
        if (resp.code != 200) {
            throw std::runtime_error(fmt::format("WebHdfsFileAccess: OPEN {} failed with HTTP {}", url_, resp.code));
        }
        Bytes out(resp.body.begin(), resp.body.end());
        if (out.size() > n) out.resize(n);
        offset_ += out.size();
        return out;
    }

private:
    const WebHdfsFileAccess& owner_;
    std::string              url_;
    std::uint64_t            offset_ = 0;
};

/* ---------- 远端追加 ---------- */
class WebHdfsWriter : public AppendWriter {
public:
    WebHdfsWriter(const WebHdfsFileAccess& owner, std::string url)
        : owner_(owner), url_(std::move(url)) {}

    void write(const char* data, std::size_t len) override {
        if (len == 0) return;
        auto rest = owner_.restUrl(url_, "APPEND");
        auto resp = owner_.request("POST", rest, data, len);
        if (resp.code != 200) {
            throw std::runtime_error(fmt::format("WebHdfsFileAccess: APPEND {} failed with HTTP {}", url_, resp.code));
        }
    }

private:
    const WebHdfsFileAccess& owner_;
    std::string              url_;
};

} // namespace

/* ---------- 构造 ---------- */
WebHdfsFileAccess::WebHdfsFileAccess() : WebHdfsFileAccess(options{}) {}

WebHdfsFileAccess::WebHdfsFileAccess(options opt) : opt_(std::move(opt))
{
    if (opt_.user.empty()) {
        const char* env = std::getenv("HADOOP_USER_NAME");
        if (env) opt_.user = env;
    }
    globalInitOnce();
}

/* ---------- URL 处理 ---------- */
WebHdfsFileAccess::Location WebHdfsFileAccess::parse(const std::string& url)
{
    const std::string prefix = std::string(SCHEME) + "://";
    if (url.rfind(prefix, 0) != 0)
        throw std::invalid_argument("WebHdfsFileAccess: not a webhdfs URL: " + url);

    Location loc;
    auto rest  = url.substr(prefix.size());
    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    loc.path = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        loc.host = authority;
    } else {
        loc.host = authority.substr(0, colon);
        try {
            loc.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("WebHdfsFileAccess: bad port in " + url);
        }
    }
    if (loc.host.empty())
        throw std::invalid_argument("WebHdfsFileAccess: missing host in " + url);
    return loc;
}

std::string WebHdfsFileAccess::encodePath(const std::string& path)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string WebHdfsFileAccess::restUrl(const std::string& url,
                                       const std::string& op,
                                       const std::string& extraQuery) const
{
    auto loc = parse(url);
    std::string out = fmt::format("{}://{}:{}/webhdfs/v1{}?op={}",
                                  opt_.use_tls ? "https" : "http",
                                  loc.host, loc.port, encodePath(loc.path), op);
    if (!opt_.user.empty()) out += "&user.name=" + encodePath(opt_.user);
    if (!extraQuery.empty()) out += "&" + extraQuery;
    return out;
}

/* ---------- libcurl 请求 ---------- */
WebHdfsFileAccess::Response WebHdfsFileAccess::request(const std::string& method,
                                                       const std::string& url,
                                                       const char* data,
                                                       std::size_t len) const
{
    CurlHandle curl;
    if (!curl.h) throw std::runtime_error("curl_easy_init failed");

    Response resp;
    CurlHeaders hdrs;
    curl_easy_setopt(curl.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.h, CURLOPT_TIMEOUT, opt_.timeout_sec);
    curl_easy_setopt(curl.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.h, CURLOPT_FOLLOWLOCATION, 1L);   // namenode -> datanode 的 307
    curl_easy_setopt(curl.h, CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
    curl_easy_setopt(curl.h, CURLOPT_WRITEFUNCTION, collect_cb);
    curl_easy_setopt(curl.h, CURLOPT_WRITEDATA, &resp.body);

    if (method == "POST" || method == "PUT") {
        curl_easy_setopt(curl.h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(curl.h, CURLOPT_POSTFIELDS, data ? data : "");
        curl_easy_setopt(curl.h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(data ? len : 0));
        hdrs.list = curl_slist_append(hdrs.list, "Content-Type: application/octet-stream");
        curl_easy_setopt(curl.h, CURLOPT_HTTPHEADER, hdrs.list);
    }

    CURLcode rc = curl_easy_perform(curl.h);
    if (rc != CURLE_OK) {
        spdlog::debug("WebHdfsFileAccess: {} {} failed: {}", method, url, curl_easy_strerror(rc));
        throw std::runtime_error(fmt::format("WebHdfsFileAccess: {} {} failed: {}",
                                             method, url, curl_easy_strerror(rc)));
    }
    curl_easy_getinfo(curl.h, CURLINFO_RESPONSE_CODE, &resp.code);
    return resp;
}

void WebHdfsFileAccess::throwRemote(const Response& resp, const std::string& what)
{
    std::string message = resp.body;
    try {
        auto j = json::parse(resp.body);
        if (j.contains("RemoteException"))
            message = j["RemoteException"].value("message", resp.body);
    } catch (const json::exception&) {
        // 非 JSON 响应体，保留原文
    }
    throw std::runtime_error(fmt::format("WebHdfsFileAccess: {} failed with HTTP {}: {}",
                                         what, resp.code, message));
}

/* ---------- FileAccess 协议 ---------- */
bool WebHdfsFileAccess::exists(const std::string& path)
{
    auto resp = request("GET", restUrl(path, "GETFILESTATUS"));
    if (resp.code == 200) return true;
    if (resp.code == 404) return false;
    throwRemote(resp, "GETFILESTATUS " + path);
}

std::optional<FileStat> WebHdfsFileAccess::stat(const std::string& path)
{
    auto resp = request("GET", restUrl(path, "GETFILESTATUS"));
    if (resp.code == 404) return std::nullopt;
    if (resp.code != 200) throwRemote(resp, "GETFILESTATUS " + path);

    try {
        auto st = json::parse(resp.body).at("FileStatus");
        FileStat out;
        out.size = st.at("length").get<std::uint64_t>();
        out.modifiedTime = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(st.value("modificationTime", std::int64_t{0}))));
        out.isRegular = st.value("type", std::string("FILE")) == "FILE";
        return out;
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("WebHdfsFileAccess: bad FileStatus for {}: {}", path, e.what()));
    }
}

std::unique_ptr<RandomReader> WebHdfsFileAccess::openForRandomRead(const std::string& path)
{
    parse(path);
    return std::make_unique<WebHdfsReader>(*this, path);
}

std::unique_ptr<AppendWriter> WebHdfsFileAccess::openForAppend(const std::string& path)
{
    parse(path);
    return std::make_unique<WebHdfsWriter>(*this, path);
}

void WebHdfsFileAccess::makeDirs(const std::string& path, bool existOk)
{
    if (!existOk && exists(path))
        throw std::runtime_error("WebHdfsFileAccess: directory already exists: " + path);
    auto resp = request("PUT", restUrl(path, "MKDIRS"));
    if (resp.code != 200) throwRemote(resp, "MKDIRS " + path);
}

void WebHdfsFileAccess::createFile(const std::string& path)
{
    if (exists(path)) return;
    auto resp = request("PUT", restUrl(path, "CREATE", "overwrite=false"));
    if (resp.code != 201 && resp.code != 200) throwRemote(resp, "CREATE " + path);
}

#include "shipper/file_discovery.hpp"

#include <filesystem>
#include <fnmatch.h>
#include <glob.h>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

std::string normalize(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal().string();
}

bool isRegular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::vector<std::string> splitSegments(const fs::path& p) {
    std::vector<std::string> out;
    for (const auto& part : p) {
        auto s = part.string();
        if (s.empty() || s == "/") continue;
        out.push_back(s);
    }
    return out;
}

// 逐段匹配，"**" 可匹配零个或多个目录
bool matchSegments(const std::vector<std::string>& pat, std::size_t pi,
                   const std::vector<std::string>& name, std::size_t ni) {
    if (pi == pat.size()) return ni == name.size();
    if (pat[pi] == "**") {
        for (std::size_t k = ni; k <= name.size(); ++k)
            if (matchSegments(pat, pi + 1, name, k)) return true;
        return false;
    }
    if (ni == name.size()) return false;
    if (::fnmatch(pat[pi].c_str(), name[ni].c_str(), FNM_PERIOD) != 0) return false;
    return matchSegments(pat, pi + 1, name, ni + 1);
}

/* ---------- 普通 glob ---------- */
std::set<std::string> expandGlob(const std::string& pattern) {
    std::set<std::string> out;
    glob_t g{};
    int rc = ::glob(pattern.c_str(), 0, nullptr, &g);
    if (rc == 0) {
        for (std::size_t i = 0; i < g.gl_pathc; ++i) {
            if (isRegular(g.gl_pathv[i])) out.insert(normalize(g.gl_pathv[i]));
        }
    } else if (rc != GLOB_NOMATCH) {
        spdlog::warn("file_discovery: glob '{}' failed with code {}", pattern, rc);
    }
    ::globfree(&g);
    return out;
}

/* ---------- 递归 ** ---------- */
std::set<std::string> expandRecursive(const std::string& pattern) {
    std::set<std::string> out;
    const fs::path absPattern = fs::path(normalize(pattern));

    // 找到第一个含通配符的段，之前的部分作为遍历起点
    fs::path base = absPattern.root_path();
    std::vector<std::string> rest;
    bool magicSeen = false;
    for (const auto& seg : splitSegments(absPattern.relative_path())) {
        if (!magicSeen && !file_discovery::hasMagic(seg)) base /= seg;
        else { magicSeen = true; rest.push_back(seg); }
    }

    std::error_code ec;
    if (!fs::is_directory(base, ec)) return out;

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("file_discovery: cannot walk {}: {}", base.string(), ec.message());
        return out;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("file_discovery: error while walking {}: {}", base.string(), ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) continue;
        auto rel = splitSegments(it->path().lexically_relative(base));
        if (matchSegments(rest, 0, rel, 0)) out.insert(normalize(it->path()));
    }
    return out;
}

} // namespace

namespace file_discovery {

bool hasMagic(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

std::set<std::string> expand(const std::string& pattern) {
    if (pattern.empty()) return {};
    if (isRegular(pattern)) return {normalize(pattern)};
    if (!hasMagic(pattern)) return {};
    if (pattern.find("**") != std::string::npos) return expandRecursive(pattern);
    return expandGlob(pattern);
}

std::set<std::string> discover(const std::vector<std::string>& patterns) {
    std::set<std::string> files;
    for (const auto& p : patterns) {
        auto found = expand(p);
        spdlog::debug("file_discovery: pattern '{}' matched {} file(s)", p, found.size());
        files.insert(found.begin(), found.end());
    }
    return files;
}

} // namespace file_discovery

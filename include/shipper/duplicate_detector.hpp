#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

// 两个作业同时负责的文件
struct FileOverlap {
    std::string              other;   // 另一个作业名
    std::vector<std::string> files;   // 重叠文件，有序
};

// 跨作业重叠检查，只告警不拦截
class DuplicateDetector {
public:
    using Snapshots = std::map<std::string, std::set<std::string>>;

    // 与 snapshots 中除 name 以外的每个作业求交集，返回非空的那些
    static std::vector<FileOverlap> findOverlaps(const std::string& name,
                                                 const std::set<std::string>& files,
                                                 const Snapshots& snapshots);

    // 每个重叠作业输出一条 warning
    static void report(const std::string& name, const std::vector<FileOverlap>& overlaps);
};

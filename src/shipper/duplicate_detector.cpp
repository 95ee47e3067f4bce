#include "shipper/duplicate_detector.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

std::vector<FileOverlap> DuplicateDetector::findOverlaps(const std::string& name,
                                                         const std::set<std::string>& files,
                                                         const Snapshots& snapshots)
{
    std::vector<FileOverlap> out;
    if (files.empty()) return out;
    for (const auto& [other, otherFiles] : snapshots) {
        if (other == name) continue;
        FileOverlap ov{other, {}};
        std::set_intersection(files.begin(), files.end(),
                              otherFiles.begin(), otherFiles.end(),
                              std::back_inserter(ov.files));
        if (!ov.files.empty()) out.push_back(std::move(ov));
    }
    return out;
}

void DuplicateDetector::report(const std::string& name, const std::vector<FileOverlap>& overlaps)
{
    for (const auto& ov : overlaps) {
        spdlog::warn("Duplicate copy detected: copy operation '{}' and '{}' are both copying {} file(s): {}",
                     name, ov.other, ov.files.size(), fmt::join(ov.files, ", "));
    }
}

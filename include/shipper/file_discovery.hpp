#pragma once
#include <set>
#include <string>
#include <vector>

namespace file_discovery {

// 展开路径模式：普通路径、glob（* ? [..]）、以及跨目录的 **
// 只返回普通文件，路径统一为绝对路径；匹配不到的模式静默跳过
std::set<std::string> discover(const std::vector<std::string>& patterns);

// 单个模式展开，discover 的组成部分
std::set<std::string> expand(const std::string& pattern);

// 含 * ? [ 任一字符即视为模式
bool hasMagic(const std::string& pattern);

} // namespace file_discovery

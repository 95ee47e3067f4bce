#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

// 一个拷贝作业的全部参数，start() 时校验一次，之后只读
struct ShipOptions {
    std::string                name;
    std::vector<std::string>   patterns;            // 路径或 glob，支持 **
    std::string                destination;         // 目标根目录，可带 scheme
    std::chrono::milliseconds  interval{std::chrono::seconds(60)};
    bool                       createDestDirs    = true;
    bool                       preserveStructure = false;
    std::optional<std::string> rootDir;
    int                        maxRetries = 3;
    std::chrono::milliseconds  retryDelay{std::chrono::seconds(5)};

    // 按顺序校验，第一个失败的抛 std::invalid_argument（不含名称唯一性/关闭状态）
    void validate() const;

    // 从 YAML 映射解析；缺失字段取 defaults 中的值
    static ShipOptions fromYaml(const std::string& name,
                                const YAML::Node& node,
                                const ShipOptions& defaults);

    // 读取 "interval: 1.5" 这类秒数
    static std::chrono::milliseconds secondsToMs(double seconds);
};

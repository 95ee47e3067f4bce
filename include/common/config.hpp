#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

/*----------------------------------------------------------
 * logship 配置文件
 *   shipper_config:  全局项（日志、停止超时、作业默认值）
 *   operations:      作业名 -> 作业参数
 * 取值按 [section][key] 两级定位
 *--------------------------------------------------------*/
class Config {
public:
    static constexpr const char* SHIPPER_SECTION    = "shipper_config";
    static constexpr const char* OPERATIONS_SECTION = "operations";

    explicit Config(const std::string& filePath);
    explicit Config(YAML::Node root);
    static Config fromString(const std::string& yamlText);

    // 进程级实例，第一次调用必须给出路径
    static Config& instance(const std::string& path = "");

    /* ---------- 通用读取：缺失或类型错误抛 std::runtime_error ---------- */
    int         getInt   (const std::string& section, const std::string& key) const { return read<int>(section, key); }
    double      getDouble(const std::string& section, const std::string& key) const { return read<double>(section, key); }
    bool        getBool  (const std::string& section, const std::string& key) const { return read<bool>(section, key); }
    std::string getString(const std::string& section, const std::string& key) const { return read<std::string>(section, key); }

    // 只有键缺失时才用 fallback
    template <typename T>
    T getOr(const std::string& section, const std::string& key, const T& fallback) const
    {
        return has(section, key) ? read<T>(section, key) : fallback;
    }

    template <typename T>
    std::vector<T> getArray(const std::string& section, const std::string& key) const
    {
        return read<std::vector<T>>(section, key);
    }

    template <typename T>
    std::vector<T> getArray(const std::string& section,
                            const std::string& key,
                            std::function<T(const YAML::Node&)> decoder) const
    {
        const YAML::Node list = lookup(section, key);
        if (!list.IsSequence())
            throw std::runtime_error(fmt::format("Config: [{}][{}] is not a sequence", section, key));

        std::vector<T> out;
        out.reserve(list.size());
        try {
            for (const auto& item : list) out.push_back(decoder(item));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error(fmt::format("Config: bad element in [{}][{}]: {}", section, key, e.what()));
        }
        return out;
    }

    bool has(const std::string& section, const std::string& key) const;
    bool hasSection(const std::string& section) const;

    // 原样返回整个 section，不存在时为 undefined 节点
    YAML::Node getRawNode(const std::string& section) const;

    /* ---------- shipper_config 常用项 ---------- */
    spdlog::level::level_enum logLevel() const;     // 未知名称回落到 info
    std::string               logPattern() const;
    std::chrono::milliseconds stopTimeout() const;  // 秒，默认 60
    YAML::Node                jobDefaults() const;  // shipper_config.defaults
    YAML::Node                operations() const;

private:
    // 定位到非空的值，否则抛出
    YAML::Node lookup(const std::string& section, const std::string& key) const;

    template <typename T>
    T read(const std::string& section, const std::string& key) const
    {
        const YAML::Node value = lookup(section, key);
        try {
            return value.as<T>();
        } catch (const YAML::Exception& e) {
            spdlog::error("Config: error decoding [{}][{}]: {}", section, key, e.what());
            throw std::runtime_error(fmt::format("Config: bad type for [{}][{}]", section, key));
        }
    }

    YAML::Node root_;
};

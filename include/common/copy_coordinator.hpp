#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <string>
#include <nlohmann/json.hpp>

/*==========================================================
 * 分布式部署下的拷贝开关
 * 非主节点设置 DISABLE_COPY=true，start() 即变为空操作
 *=========================================================*/
class CopyCoordinator {
public:
    static constexpr const char* ENV_DISABLE_COPY = "DISABLE_COPY";

    // 构造时读取一次环境变量
    CopyCoordinator();

    bool copyEnabled() const { return copy_enabled_; }

    // {copy_enabled, reason, environment_variable}
    nlohmann::json status() const;

    static CopyCoordinator& instance();

    // 纯函数，便于测试："true"（忽略大小写）表示关闭
    static bool parseDisableFlag(const std::string& value);

private:
    std::string raw_value_;
    bool        copy_enabled_ = true;
};

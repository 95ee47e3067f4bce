#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>

#include <cxxopts.hpp>

#include "common/config.hpp"
#include "common/copy_coordinator.hpp"
#include "shipper/copy_manager.hpp"

void init() {
    // 初始化日志系统
    auto& config = Config::instance();
    spdlog::set_level(config.logLevel());
    spdlog::set_pattern(config.logPattern());
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("logship", "Incremental log file shipper");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("o,once", "Copy every configured operation once, then exit")
        ("s,status", "Print operation status as JSON after start-up");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 2;
    }
    const auto& result = *parsed;
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    try {
        Config::instance(result["config"].as<std::string>());
        init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    auto& config = Config::instance();
    std::chrono::milliseconds timeout{};
    try {
        timeout = config.stopTimeout();
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }

    spdlog::info("Main: copy coordinator status: {}", CopyCoordinator::instance().status().dump());

    auto& manager = CopyManager::instance();
    try {
        manager.startFromConfig(config.operations(), config.jobDefaults());
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }

    if (result.count("status")) {
        std::cout << manager.snapshot().dump(2) << std::endl;
    }

    if (result.count("once")) {
        manager.cleanup(timeout);
        return 0;
    }

    // 常驻；SIGINT/SIGTERM 由 CopyManager 处理后按默认方式终止进程
    std::mutex mtx;
    std::condition_variable cv;
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [] { return false; });
    return 0; // 永远不会到达这里
}

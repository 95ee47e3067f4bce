#include "common/copy_coordinator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

CopyCoordinator::CopyCoordinator() {
    const char* env = std::getenv(ENV_DISABLE_COPY);
    raw_value_    = env ? env : "";
    copy_enabled_ = !parseDisableFlag(raw_value_);
    if (!copy_enabled_) {
        spdlog::info("CopyCoordinator: copy disabled via {} environment variable", ENV_DISABLE_COPY);
    } else {
        spdlog::debug("CopyCoordinator: copy enabled (default behavior)");
    }
}

CopyCoordinator& CopyCoordinator::instance() {
    static CopyCoordinator ins;
    return ins;
}

bool CopyCoordinator::parseDisableFlag(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "true";
}

nlohmann::json CopyCoordinator::status() const {
    nlohmann::json j;
    j["copy_enabled"] = copy_enabled_;
    j["reason"] = copy_enabled_ ? "Default behavior (enabled)"
                                : std::string(ENV_DISABLE_COPY) + "=true";
    j["environment_variable"][ENV_DISABLE_COPY] = raw_value_;
    return j;
}

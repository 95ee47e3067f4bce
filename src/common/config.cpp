#include "common/config.hpp"

#include <cmath>
#include <map>
#include <memory>
#include <mutex>

namespace {

YAML::Node parseOrThrow(const std::function<YAML::Node()>& load, const std::string& origin)
{
    try {
        return load();
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: cannot open {}: {}", origin, e.what());
        throw std::runtime_error("Config: cannot open file: " + origin);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: malformed {}: {}", origin, e.what());
        throw std::runtime_error(fmt::format("Config: malformed {}: {}", origin, e.what()));
    }
}

} // namespace

Config::Config(const std::string& filePath)
    : root_(parseOrThrow([&] { return YAML::LoadFile(filePath); }, filePath))
{
    spdlog::info("Config: loaded configuration from {}", filePath);
}

Config::Config(YAML::Node root) : root_(std::move(root)) {}

Config Config::fromString(const std::string& yamlText)
{
    return Config(parseOrThrow([&] { return YAML::Load(yamlText); }, "inline configuration"));
}

Config& Config::instance(const std::string& path)
{
    static std::once_flag             once;
    static std::unique_ptr<Config>    cfg;
    std::call_once(once, [&] {
        if (path.empty())
            throw std::runtime_error("Config path not provided on first call");
        cfg = std::make_unique<Config>(path);
    });
    return *cfg;
}

/* ---------- 定位 ---------- */
YAML::Node Config::lookup(const std::string& section, const std::string& key) const
{
    if (has(section, key)) return root_[section][key];
    throw std::runtime_error(fmt::format("Config: missing [{}][{}]", section, key));
}

bool Config::hasSection(const std::string& section) const
{
    return root_.IsMap() && root_[section].IsDefined() && !root_[section].IsNull();
}

bool Config::has(const std::string& section, const std::string& key) const
{
    if (!hasSection(section) || !root_[section].IsMap()) return false;
    const YAML::Node value = root_[section][key];
    return value.IsDefined() && !value.IsNull();
}

YAML::Node Config::getRawNode(const std::string& section) const
{
    if (!root_.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    return root_[section];
}

/* ---------- shipper_config ---------- */
spdlog::level::level_enum Config::logLevel() const
{
    static const std::map<std::string, spdlog::level::level_enum> levels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto it = levels.find(getOr<std::string>(SHIPPER_SECTION, "log_level", "info"));
    return it == levels.end() ? spdlog::level::info : it->second;
}

std::string Config::logPattern() const
{
    return getOr<std::string>(SHIPPER_SECTION, "log_pattern", "[%Y-%m-%d %H:%M:%S] [%l] %v");
}

std::chrono::milliseconds Config::stopTimeout() const
{
    const double seconds = getOr<double>(SHIPPER_SECTION, "stop_timeout", 60.0);
    if (seconds < 0)
        throw std::runtime_error("Config: stop_timeout cannot be negative");
    return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

YAML::Node Config::jobDefaults() const
{
    return has(SHIPPER_SECTION, "defaults") ? root_[SHIPPER_SECTION]["defaults"] : YAML::Node();
}

YAML::Node Config::operations() const
{
    return getRawNode(OPERATIONS_SECTION);
}

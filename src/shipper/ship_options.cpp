#include "shipper/ship_options.hpp"

#include <cmath>
#include <stdexcept>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

std::chrono::milliseconds ShipOptions::secondsToMs(double seconds)
{
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

void ShipOptions::validate() const
{
    if (patterns.empty())
        throw std::invalid_argument("path patterns cannot be empty");
    if (destination.empty())
        throw std::invalid_argument("copy destination cannot be empty");
    if (interval.count() <= 0)
        throw std::invalid_argument("copy interval must be positive");
    if (maxRetries < 0)
        throw std::invalid_argument("max retries cannot be negative");
    if (retryDelay.count() < 0)
        throw std::invalid_argument("retry delay cannot be negative");
    if (preserveStructure && (!rootDir || rootDir->empty()))
        throw std::invalid_argument(
            "'root_dir' must be specified when 'preserve_structure' is true");
}

ShipOptions ShipOptions::fromYaml(const std::string& name,
                                  const YAML::Node& node,
                                  const ShipOptions& defaults)
{
    if (!node.IsMap())
        throw std::invalid_argument(fmt::format("operation '{}' must be a mapping", name));

    ShipOptions opt = defaults;
    opt.name = name;
    try {
        if (const auto p = node["patterns"]) {
            if (p.IsSequence()) opt.patterns = p.as<std::vector<std::string>>();
            else                opt.patterns = {p.as<std::string>()};
        }
        if (const auto d = node["destination"])        opt.destination       = d.as<std::string>();
        if (const auto i = node["interval"])           opt.interval          = secondsToMs(i.as<double>());
        if (const auto c = node["create_dest_dirs"])   opt.createDestDirs    = c.as<bool>();
        if (const auto s = node["preserve_structure"]) opt.preserveStructure = s.as<bool>();
        if (const auto r = node["root_dir"])           opt.rootDir           = r.as<std::string>();
        if (const auto m = node["max_retries"])        opt.maxRetries        = m.as<int>();
        if (const auto d = node["retry_delay"])        opt.retryDelay        = secondsToMs(d.as<double>());
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(fmt::format("operation '{}': bad value: {}", name, e.what()));
    }
    return opt;
}

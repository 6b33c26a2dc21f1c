#include "tollgate/logging.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace tollgate::logging
{
    Result<spdlog::level::level_enum> parse_level(const std::string &name)
    {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "trace")
            return spdlog::level::trace;
        if (lowered == "debug")
            return spdlog::level::debug;
        if (lowered == "info")
            return spdlog::level::info;
        if (lowered == "warn" || lowered == "warning")
            return spdlog::level::warn;
        if (lowered == "error")
            return spdlog::level::err;
        if (lowered == "critical")
            return spdlog::level::critical;
        if (lowered == "off")
            return spdlog::level::off;
        return std::unexpected(TollgateError::invalid_configuration("Invalid log level: " + name));
    }

    Result<void> init(const LoggingConfig &cfg)
    {
        auto level = parse_level(cfg.level);
        if (!level)
            return std::unexpected(level.error());
        spdlog::set_level(*level);
        if (!cfg.pattern.empty())
            spdlog::set_pattern(cfg.pattern);
        return {};
    }

} // namespace tollgate::logging

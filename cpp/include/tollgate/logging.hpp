#pragma once

#include "types.hpp"
#include <spdlog/common.h>
#include <string>

namespace tollgate
{
    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v"};
    };

    namespace logging
    {
        /** Map "trace" .. "critical" / "off" to an spdlog level. */
        Result<spdlog::level::level_enum> parse_level(const std::string &name);

        /** Apply level and pattern to the default spdlog logger. */
        Result<void> init(const LoggingConfig &cfg);
    }

} // namespace tollgate

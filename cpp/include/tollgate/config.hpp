#pragma once

#include "types.hpp"
#include "logging.hpp"
#include "rate_limiter.hpp"
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tollgate
{

    enum class LimiterKind
    {
        PerSecond,
        PerMinute,
        CallsPerMinute
    };

    std::string limiter_kind_to_string(LimiterKind kind);
    Result<LimiterKind> limiter_kind_from_string(const std::string &s);

    /**
     * One named limiter definition from the [limiters.<name>] table.
     */
    struct LimiterSpec
    {
        LimiterKind kind{LimiterKind::PerSecond};
        double rate{1.0};
        std::optional<bool> log_denials; // unset: per-minute buckets log, others don't

        /** Map to bucket parameters; `name` labels the bucket in log lines. */
        TokenBucket::Config to_bucket_config(const std::string &name) const;
    };

    struct TollgateConfig
    {
        LoggingConfig logging{};
        std::map<std::string, LimiterSpec> limiters;
    };

    /**
     * Builds the bucket for a limiter definition. Calls-per-minute limiters
     * are inspectable; the other kinds only admit.
     */
    Result<std::unique_ptr<TokenBucket>> make_limiter(const std::string &name, const LimiterSpec &spec,
                                                      TimeSource clock = BucketClock::now);

    /**
     * ConfigLoader loads TOML configs with environment overrides
     * (TOLLGATE_LOG_LEVEL, TOLLGATE_LOG_PATTERN). Every limiter definition is
     * validated so a loaded config always yields constructible buckets.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<TollgateConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<TollgateConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const TollgateConfig &cfg);

    private:
        static void apply_env_overrides(TollgateConfig &cfg);
    };

} // namespace tollgate

#include "tollgate/config.hpp"
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace tollgate
{
    std::string limiter_kind_to_string(LimiterKind kind)
    {
        switch (kind)
        {
        case LimiterKind::PerSecond:
            return "per_second";
        case LimiterKind::PerMinute:
            return "per_minute";
        case LimiterKind::CallsPerMinute:
            return "calls_per_minute";
        }
        return "unknown";
    }

    Result<LimiterKind> limiter_kind_from_string(const std::string &s)
    {
        if (s == "per_second")
            return LimiterKind::PerSecond;
        if (s == "per_minute")
            return LimiterKind::PerMinute;
        if (s == "calls_per_minute")
            return LimiterKind::CallsPerMinute;
        return std::unexpected(TollgateError::invalid_configuration(std::format("Invalid limiter kind: {}", s)));
    }

    TokenBucket::Config LimiterSpec::to_bucket_config(const std::string &name) const
    {
        TokenBucket::Config cfg;
        switch (kind)
        {
        case LimiterKind::PerSecond:
            cfg = TokenBucket::Config::per_second(rate);
            break;
        case LimiterKind::PerMinute:
            cfg = TokenBucket::Config::per_minute(rate);
            break;
        case LimiterKind::CallsPerMinute:
            cfg = TokenBucket::Config::calls_per_minute(rate);
            break;
        }
        if (log_denials)
            cfg.log_denials = *log_denials;
        cfg.name = name;
        return cfg;
    }

    Result<std::unique_ptr<TokenBucket>> make_limiter(const std::string &name, const LimiterSpec &spec,
                                                      TimeSource clock)
    {
        auto cfg = spec.to_bucket_config(name);
        if (spec.kind == LimiterKind::CallsPerMinute)
        {
            auto bucket = InspectableTokenBucket::create(cfg, std::move(clock));
            if (!bucket)
                return std::unexpected(bucket.error());
            return std::unique_ptr<TokenBucket>(std::move(*bucket));
        }
        return TokenBucket::create(cfg, std::move(clock));
    }

    namespace
    {
        Result<LimiterSpec> parse_limiter(const std::string &name, const toml::table &tbl)
        {
            LimiterSpec spec;

            auto kind = tbl["kind"].value<std::string>();
            if (!kind)
            {
                return std::unexpected(TollgateError::invalid_configuration(
                    std::format("limiter '{}': missing 'kind'", name)));
            }
            auto parsed_kind = limiter_kind_from_string(*kind);
            if (!parsed_kind)
                return std::unexpected(parsed_kind.error());
            spec.kind = *parsed_kind;

            auto rate = tbl["rate"].value<double>();
            if (!rate)
            {
                return std::unexpected(TollgateError::invalid_configuration(
                    std::format("limiter '{}': missing numeric 'rate'", name)));
            }
            spec.rate = *rate;

            if (auto log = tbl["log_denials"].value<bool>())
                spec.log_denials = *log;

            // Reject configs whose buckets could not be built.
            if (auto ok = TokenBucket::validate(spec.to_bucket_config(name)); !ok)
                return std::unexpected(ok.error());
            return spec;
        }

        Result<TollgateConfig> parse_toml(const toml::table &tbl, TollgateConfig cfg)
        {
            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto pattern = (*logging)["pattern"].value<std::string>())
                    cfg.logging.pattern = *pattern;
            }

            if (auto limiters = tbl["limiters"].as_table())
            {
                for (auto &&[key, node] : *limiters)
                {
                    std::string name(key.str());
                    auto limiter_tbl = node.as_table();
                    if (!limiter_tbl)
                    {
                        return std::unexpected(TollgateError::config(
                            std::format("limiters.{} must be a table", name)));
                    }
                    auto spec = parse_limiter(name, *limiter_tbl);
                    if (!spec)
                        return std::unexpected(spec.error());
                    cfg.limiters[name] = *spec;
                }
            }

            return cfg;
        }

    } // namespace

    Result<TollgateConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(TollgateError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<TollgateConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        TollgateConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(TollgateError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        apply_env_overrides(cfg);

        if (auto level = logging::parse_level(cfg.logging.level); !level)
            return std::unexpected(level.error());
        return cfg;
    }

    void ConfigLoader::apply_env_overrides(TollgateConfig &cfg)
    {
        if (const char *level = std::getenv("TOLLGATE_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *pattern = std::getenv("TOLLGATE_LOG_PATTERN"))
            cfg.logging.pattern = pattern;
    }

    nlohmann::json ConfigLoader::to_json(const TollgateConfig &cfg)
    {
        nlohmann::json j;
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        nlohmann::json limiters = nlohmann::json::object();
        for (const auto &[name, spec] : cfg.limiters)
        {
            auto bucket = spec.to_bucket_config(name);
            limiters[name] = {
                {"kind", limiter_kind_to_string(spec.kind)},
                {"rate", spec.rate},
                {"capacity", bucket.capacity},
                {"refill_per_second", bucket.refill_per_second},
                {"log_denials", bucket.log_denials}};
        }
        j["limiters"] = limiters;
        return j;
    }

} // namespace tollgate

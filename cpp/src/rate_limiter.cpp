#include "tollgate/rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <spdlog/spdlog.h>

namespace tollgate
{
    TokenBucket::Config TokenBucket::Config::per_second(double rate_limit)
    {
        Config cfg;
        cfg.capacity = rate_limit;
        cfg.refill_per_second = rate_limit;
        return cfg;
    }

    TokenBucket::Config TokenBucket::Config::per_minute(double rate_limit)
    {
        Config cfg;
        cfg.capacity = rate_limit * 60.0;
        cfg.refill_per_second = rate_limit;
        cfg.log_denials = true;
        return cfg;
    }

    TokenBucket::Config TokenBucket::Config::calls_per_minute(double calls_per_minute)
    {
        Config cfg;
        cfg.capacity = calls_per_minute;
        cfg.refill_per_second = calls_per_minute / 60.0;
        return cfg;
    }

    Result<void> TokenBucket::validate(const Config &cfg)
    {
        if (!std::isfinite(cfg.refill_per_second) || !(cfg.refill_per_second > 0.0))
        {
            return std::unexpected(TollgateError::invalid_configuration(
                std::format("bucket '{}': rate must be a finite number greater than zero", cfg.name)));
        }
        if (!std::isfinite(cfg.capacity) || cfg.capacity < 0.0)
        {
            return std::unexpected(TollgateError::invalid_configuration(
                std::format("bucket '{}': capacity must be a finite, non-negative number", cfg.name)));
        }
        // get_remaining_calls() reports whole units as int64.
        if (cfg.capacity >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
        {
            return std::unexpected(TollgateError::invalid_configuration(
                std::format("bucket '{}': capacity {} exceeds the largest countable budget", cfg.name, cfg.capacity)));
        }
        return {};
    }

    TokenBucket::TokenBucket(const Config &cfg, TimeSource clock)
        : cfg_(cfg), clock_(std::move(clock)), available_(cfg.capacity)
    {
        if (auto ok = validate(cfg_); !ok)
            throw ok.error();
        if (!clock_)
            throw TollgateError::invalid_configuration("bucket '" + cfg_.name + "': time source is empty");
        last_refill_ = clock_();
        spdlog::debug("bucket '{}' created: capacity={} refill_per_second={}",
                      cfg_.name, cfg_.capacity, cfg_.refill_per_second);
    }

    Result<std::unique_ptr<TokenBucket>> TokenBucket::create(const Config &cfg, TimeSource clock)
    {
        if (auto ok = validate(cfg); !ok)
            return std::unexpected(ok.error());
        if (!clock)
            return std::unexpected(TollgateError::invalid_configuration("time source is empty"));
        return std::make_unique<TokenBucket>(cfg, std::move(clock));
    }

    double TokenBucket::refilled(BucketClock::time_point now) const
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - last_refill_).count();
        if (elapsed <= 0)
            return available_;
        return std::min(cfg_.capacity, available_ + elapsed * cfg_.refill_per_second);
    }

    bool TokenBucket::acquire()
    {
        double budget = 0.0;
        {
            std::lock_guard lock(mutex_);
            auto now = clock_();
            available_ = refilled(now);
            if (now > last_refill_)
                last_refill_ = now;
            if (available_ >= 1.0)
            {
                available_ -= 1.0;
                return true;
            }
            budget = available_;
        }
        if (cfg_.log_denials)
        {
            spdlog::warn("bucket '{}' denied admission, waiting to be topped up; current budget {:.3f}",
                         cfg_.name, budget);
        }
        return false;
    }

    InspectableTokenBucket::InspectableTokenBucket(const Config &cfg, TimeSource clock)
        : TokenBucket(cfg, std::move(clock))
    {
    }

    Result<std::unique_ptr<InspectableTokenBucket>> InspectableTokenBucket::create(const Config &cfg,
                                                                                   TimeSource clock)
    {
        if (auto ok = validate(cfg); !ok)
            return std::unexpected(ok.error());
        if (!clock)
            return std::unexpected(TollgateError::invalid_configuration("time source is empty"));
        return std::make_unique<InspectableTokenBucket>(cfg, std::move(clock));
    }

    std::int64_t InspectableTokenBucket::get_remaining_calls() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::int64_t>(std::floor(refilled(clock_())));
    }

    double InspectableTokenBucket::get_time_to_next_call() const
    {
        std::lock_guard lock(mutex_);
        double current = refilled(clock_());
        if (current >= 1.0)
            return 0.0;
        if (cfg_.capacity < 1.0)
            return std::numeric_limits<double>::infinity();
        return (1.0 - current) / cfg_.refill_per_second;
    }

} // namespace tollgate

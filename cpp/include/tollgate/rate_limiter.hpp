#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tollgate
{
    using BucketClock = std::chrono::steady_clock;

    /** Source of "now" for a bucket; injectable so tests can drive time by hand. */
    using TimeSource = std::function<BucketClock::time_point()>;

    /**
     * Non-blocking admission check. Implementations never wait for budget to
     * arrive; a denied caller decides whether to drop, queue or retry.
     */
    class Admission
    {
    public:
        virtual ~Admission() = default;

        /** Debit one unit and return true if budget is available, else return false. */
        virtual bool acquire() = 0;
    };

    /**
     * Read-only view of a bucket's budget. Queries never consume budget and
     * never advance the refill timestamp.
     */
    class BucketInspector
    {
    public:
        virtual ~BucketInspector() = default;

        /** Whole units currently available. */
        virtual std::int64_t get_remaining_calls() const = 0;

        /** Seconds until one unit is available; 0.0 if one already is. */
        virtual double get_time_to_next_call() const = 0;
    };

    /**
     * Thread-safe token bucket with lazy refill.
     * Starts full; each acquire() refills by elapsed time * refill rate,
     * capped at capacity, then debits one unit if at least one is held.
     */
    class TokenBucket : public Admission
    {
    public:
        struct Config
        {
            double capacity{60.0};
            double refill_per_second{1.0};
            bool log_denials{false}; // warn-level line on each denial
            std::string name{"bucket"};

            /** Capacity `rate_limit`, refilled at `rate_limit` per second. */
            static Config per_second(double rate_limit);

            /** Capacity `rate_limit * 60`, refilled at `rate_limit` per second. Logs denials. */
            static Config per_minute(double rate_limit);

            /** Capacity `calls_per_minute`, refilled at `calls_per_minute` per minute. */
            static Config calls_per_minute(double calls_per_minute);
        };

        /** Throws TollgateError (InvalidConfiguration) if the config fails validate(). */
        explicit TokenBucket(const Config &cfg, TimeSource clock = BucketClock::now);
        ~TokenBucket() override = default;

        TokenBucket(const TokenBucket &) = delete;
        TokenBucket &operator=(const TokenBucket &) = delete;

        /** Rejects a non-finite or non-positive refill rate and a negative, non-finite or int64-overflowing capacity. */
        static Result<void> validate(const Config &cfg);

        static Result<std::unique_ptr<TokenBucket>> create(const Config &cfg,
                                                           TimeSource clock = BucketClock::now);

        bool acquire() override;

        const Config &config() const { return cfg_; }

    protected:
        // Budget refilled up to `now` without touching state. Caller holds mutex_.
        double refilled(BucketClock::time_point now) const;

        Config cfg_;
        TimeSource clock_;
        double available_;
        BucketClock::time_point last_refill_;
        mutable std::mutex mutex_;
    };

    /**
     * Token bucket that also answers read-only budget queries.
     */
    class InspectableTokenBucket : public TokenBucket, public BucketInspector
    {
    public:
        explicit InspectableTokenBucket(const Config &cfg, TimeSource clock = BucketClock::now);

        static Result<std::unique_ptr<InspectableTokenBucket>> create(const Config &cfg,
                                                                      TimeSource clock = BucketClock::now);

        std::int64_t get_remaining_calls() const override;

        /** Returns +infinity when capacity is below one unit. */
        double get_time_to_next_call() const override;
    };

} // namespace tollgate

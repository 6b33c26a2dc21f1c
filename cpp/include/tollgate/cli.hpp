#pragma once

#include "rate_limiter.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>

namespace tollgate::cli
{
    /**
     * One line of `probe` output: {"call", "admitted"} plus, for inspectable
     * buckets, "remaining_calls" and "time_to_next_call". A wait that can never
     * finish (capacity below one unit) is written as null.
     */
    nlohmann::json admission_report(std::size_t call, bool admitted, const BucketInspector *inspector);

    /** Entry point for the tollgate command line; returns the process exit code. */
    int run(int argc, char *argv[]);
}

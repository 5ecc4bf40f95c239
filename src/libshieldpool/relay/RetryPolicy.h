#pragma once

#include <libshieldpool/relay/ErrorClassifier.h>
#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>
#include <chrono>
#include <functional>
#include <string>

namespace shieldpool {
namespace relay {

struct RetrySetup
{
    unsigned maxAttempts = 3;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxJitter{500};
    std::chrono::milliseconds overallTimeout{30000};
};

struct RetryFailure
{
    ErrorCategory category = ErrorCategory::Unknown;
    std::string message;
    unsigned attempts = 0;
    bool timedOut = false;
};

/**
    Exponential backoff with jitter under an overall time budget.

    Clock, sleep and jitter are injectable so tests run without waiting.
*/
class RetryPolicy
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using JitterFn = std::function<std::chrono::milliseconds(std::chrono::milliseconds)>;

    RetryPolicy(RetrySetup setup, beast::Journal journal);
    RetryPolicy(
        RetrySetup setup,
        beast::Journal journal,
        NowFn now,
        SleepFn sleep,
        JitterFn jitter);

    /** base * 2^(completed - 1) + jitter, before attempt completed + 1. */
    std::chrono::milliseconds
    backoff(unsigned completed) const;

    /**
        Runs attempt until it returns, a non-retryable failure occurs, the
        attempts run out or the budget is spent. Any exception thrown by
        attempt is classified by its message; the last failure is returned.
    */
    ripple::Expected<std::string, RetryFailure>
    run(std::function<std::string()> const& attempt) const;

    RetrySetup const&
    setup() const
    {
        return setup_;
    }

private:
    RetrySetup const setup_;
    beast::Journal j_;
    NowFn now_;
    SleepFn sleep_;
    JitterFn jitter_;
};

} // namespace relay
} // namespace shieldpool

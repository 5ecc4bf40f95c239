#include "RetryPolicy.h"
#include <xrpl/basics/Log.h>
#include <xrpl/basics/random.h>
#include <algorithm>
#include <thread>

namespace shieldpool {
namespace relay {

using namespace std::chrono;

RetryPolicy::RetryPolicy(RetrySetup setup, beast::Journal journal)
    : RetryPolicy(
          setup,
          journal,
          [] { return Clock::now(); },
          [](milliseconds d) { std::this_thread::sleep_for(d); },
          [](milliseconds max) {
              if (max.count() <= 0)
                  return milliseconds{0};
              return milliseconds{ripple::rand_int<std::int64_t>(0, max.count() - 1)};
          })
{
}

RetryPolicy::RetryPolicy(
    RetrySetup setup,
    beast::Journal journal,
    NowFn now,
    SleepFn sleep,
    JitterFn jitter)
    : setup_(setup)
    , j_(journal)
    , now_(std::move(now))
    , sleep_(std::move(sleep))
    , jitter_(std::move(jitter))
{
}

milliseconds
RetryPolicy::backoff(unsigned completed) const
{
    auto const shift = std::min(completed == 0 ? 0u : completed - 1, 20u);
    return setup_.baseDelay * (std::int64_t{1} << shift) + jitter_(setup_.maxJitter);
}

ripple::Expected<std::string, RetryFailure>
RetryPolicy::run(std::function<std::string()> const& attempt) const
{
    auto const start = now_();
    RetryFailure last;

    auto timeout = [&](unsigned completed) {
        auto const elapsed = duration_cast<milliseconds>(now_() - start);
        JLOG(j_.warn()) << "submission budget spent after " << elapsed.count() << "ms, "
                        << completed << " attempts";
        RetryFailure f;
        f.category = ErrorCategory::TransientNetwork;
        f.message = "Transaction submission timed out after " + std::to_string(elapsed.count()) +
            "ms (" + std::to_string(completed) + " attempts). Last error: " +
            (last.message.empty() ? std::string("unknown") : last.message);
        f.attempts = completed;
        f.timedOut = true;
        return ripple::Unexpected(std::move(f));
    };

    for (unsigned n = 1; n <= setup_.maxAttempts; ++n)
    {
        auto const elapsed = duration_cast<milliseconds>(now_() - start);
        if (elapsed >= setup_.overallTimeout)
            return timeout(n - 1);

        try
        {
            JLOG(j_.debug()) << "attempt " << n << "/" << setup_.maxAttempts << ", "
                             << (setup_.overallTimeout - elapsed).count() << "ms left";
            auto result = attempt();
            JLOG(j_.debug()) << "attempt " << n << " succeeded";
            return result;
        }
        catch (std::exception const& e)
        {
            last.message = e.what();
            last.category = classify(last.message);
            last.attempts = n;
        }

        JLOG(j_.warn()) << "attempt " << n << " failed [" << to_string(last.category)
                        << "]: " << last.message;

        if (!isRetryable(last.category))
            return ripple::Unexpected(std::move(last));

        if (n < setup_.maxAttempts)
        {
            // the attempt itself may have spent the budget
            auto const left =
                setup_.overallTimeout - duration_cast<milliseconds>(now_() - start);
            if (left.count() <= 0)
                return timeout(n);
            auto const delay = std::min(backoff(n), left);
            JLOG(j_.debug()) << "backing off " << delay.count() << "ms";
            sleep_(delay);
        }
    }

    JLOG(j_.warn()) << "all " << setup_.maxAttempts << " attempts failed";
    return ripple::Unexpected(std::move(last));
}

} // namespace relay
} // namespace shieldpool

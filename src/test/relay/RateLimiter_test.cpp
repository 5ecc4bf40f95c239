#include <libshieldpool/relay/RateLimiter.h>
#include <xrpl/beast/unit_test.h>

namespace shieldpool {

class RateLimiter_test : public beast::unit_test::suite
{
    using Clock = relay::RateLimiter::Clock;

public:
    void
    run() override
    {
        testPerKey();
        testGlobal();
        testGlobalDenialUncounted();
        testWindow();
    }

    void
    testPerKey()
    {
        testcase("per key limit");

        Clock::time_point now{};
        relay::RateLimiter limiter({std::chrono::seconds{60}, 3, 100}, [&] { return now; });

        for (int i = 0; i < 3; ++i)
            BEAST_EXPECT(limiter.allow("10.0.0.1"));
        BEAST_EXPECT(!limiter.allow("10.0.0.1"));
        BEAST_EXPECT(!limiter.allow("10.0.0.1"));

        // other keys keep their own budget
        BEAST_EXPECT(limiter.allow("10.0.0.2"));
        BEAST_EXPECT(limiter.trackedKeys() == 2);
    }

    void
    testGlobal()
    {
        testcase("global limit");

        Clock::time_point now{};
        relay::RateLimiter limiter({std::chrono::seconds{60}, 2, 4}, [&] { return now; });

        BEAST_EXPECT(limiter.allow("a"));
        BEAST_EXPECT(limiter.allow("a"));
        // denied by its own limit, which does not count globally
        BEAST_EXPECT(!limiter.allow("a"));
        BEAST_EXPECT(limiter.allow("b"));
        BEAST_EXPECT(limiter.allow("c"));
        BEAST_EXPECT(!limiter.allow("d"));
    }

    void
    testGlobalDenialUncounted()
    {
        testcase("global denial leaves the key budget intact");

        Clock::time_point now{};
        relay::RateLimiter limiter({std::chrono::seconds{60}, 2, 2}, [&] { return now; });

        BEAST_EXPECT(limiter.allow("a"));
        BEAST_EXPECT(limiter.allow("a"));

        now += std::chrono::seconds{30};
        BEAST_EXPECT(!limiter.allow("b"));

        // the global window rolls over while b's window, opened at 30s, lives on
        now += std::chrono::seconds{30};
        BEAST_EXPECT(limiter.allow("b"));
        BEAST_EXPECT(limiter.allow("b"));
        BEAST_EXPECT(!limiter.allow("b"));
    }

    void
    testWindow()
    {
        testcase("window rollover");

        Clock::time_point now{};
        relay::RateLimiter limiter({std::chrono::seconds{60}, 1, 100}, [&] { return now; });

        BEAST_EXPECT(limiter.allow("a"));
        BEAST_EXPECT(!limiter.allow("a"));

        now += std::chrono::seconds{59};
        BEAST_EXPECT(!limiter.allow("a"));
        BEAST_EXPECT(limiter.allow("b"));

        now += std::chrono::seconds{1};
        BEAST_EXPECT(limiter.allow("a"));
        // b's window started a second later and is still live
        BEAST_EXPECT(!limiter.allow("b"));
        BEAST_EXPECT(limiter.trackedKeys() == 2);

        now += std::chrono::seconds{120};
        BEAST_EXPECT(limiter.allow("c"));
        // the global rollover drops stale keys
        BEAST_EXPECT(limiter.trackedKeys() == 1);
    }
};

BEAST_DEFINE_TESTSUITE(RateLimiter, relay, shieldpool);

} // namespace shieldpool

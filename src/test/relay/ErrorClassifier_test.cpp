#include <libshieldpool/relay/ErrorClassifier.h>
#include <xrpl/beast/unit_test.h>
#include <string>

namespace shieldpool {

class ErrorClassifier_test : public beast::unit_test::suite
{
public:
    void
    run() override
    {
        testClassify();
        testPrecedence();
        testMappings();
    }

    void
    testClassify()
    {
        testcase("classification table");
        using namespace relay;

        struct Case
        {
            char const* message;
            ErrorCategory expected;
        };
        Case const cases[] = {
            {"Invalid proof", ErrorCategory::Validation},
            {"Transaction simulation failed: Error processing Instruction 0", ErrorCategory::Validation},
            {"Transaction failed: instruction error {\"Custom\":\"6001\"}", ErrorCategory::Validation},
            {"custom program error: 0x1770", ErrorCategory::Validation},
            {"AccountNotFound: account not found", ErrorCategory::Validation},
            {"Nullifier already spent", ErrorCategory::StateConflict},
            {"This transaction has already been processed", ErrorCategory::StateConflict},
            {"Duplicate signature", ErrorCategory::StateConflict},
            {"Attempt to debit an account but found no record of a prior credit: insufficient funds",
             ErrorCategory::Resource},
            {"insufficient lamports 5000, need 10000", ErrorCategory::Resource},
            {"Blockhash not found", ErrorCategory::TransientNetwork},
            {"BlockhashNotFound", ErrorCategory::TransientNetwork},
            {"network error: timeout during connect", ErrorCategory::TransientNetwork},
            {"network error: connect: Connection refused", ErrorCategory::TransientNetwork},
            {"rpc http status 503", ErrorCategory::TransientNetwork},
            {"429 Too Many Requests", ErrorCategory::TransientNetwork},
            {"transaction expired: abc not confirmed within 30000ms", ErrorCategory::TransientNetwork},
            {"Node is behind by 42 slots", ErrorCategory::TransientNetwork},
            {"something odd happened", ErrorCategory::Unknown},
            {"", ErrorCategory::Unknown},
        };

        for (auto const& c : cases)
        {
            auto const got = classify(c.message);
            expect(
                got == c.expected,
                std::string(c.message) + " -> " + to_string(got) + ", expected " +
                    to_string(c.expected));
        }
    }

    void
    testPrecedence()
    {
        testcase("validation wins ties");
        using namespace relay;

        BEAST_EXPECT(
            classify("Simulation failed: nullifier already spent") == ErrorCategory::Validation);
        BEAST_EXPECT(
            classify("custom program error after timeout") == ErrorCategory::Validation);
        BEAST_EXPECT(
            classify("duplicate request, insufficient funds") == ErrorCategory::StateConflict);
        BEAST_EXPECT(
            classify("insufficient balance, service unavailable") == ErrorCategory::Resource);
        BEAST_EXPECT(classify("INVALID PROOF") == ErrorCategory::Validation);
    }

    void
    testMappings()
    {
        testcase("retry and status mapping");
        using namespace relay;

        BEAST_EXPECT(!isRetryable(ErrorCategory::Validation));
        BEAST_EXPECT(!isRetryable(ErrorCategory::StateConflict));
        BEAST_EXPECT(!isRetryable(ErrorCategory::Resource));
        BEAST_EXPECT(isRetryable(ErrorCategory::TransientNetwork));
        BEAST_EXPECT(isRetryable(ErrorCategory::Unknown));

        BEAST_EXPECT(httpStatus(ErrorCategory::Validation) == 400);
        BEAST_EXPECT(httpStatus(ErrorCategory::StateConflict) == 409);
        BEAST_EXPECT(httpStatus(ErrorCategory::Resource) == 422);
        BEAST_EXPECT(httpStatus(ErrorCategory::TransientNetwork) == 503);
        BEAST_EXPECT(httpStatus(ErrorCategory::Unknown) == 500);

        BEAST_EXPECT(std::string(to_string(ErrorCategory::TransientNetwork)) == "TRANSIENT_RPC");
        BEAST_EXPECT(std::string(to_string(ErrorCategory::Validation)) == "VALIDATION_ERROR");
        BEAST_EXPECT(std::string(publicMessage(ErrorCategory::StateConflict)) == "Nullifier already spent");
    }
};

BEAST_DEFINE_TESTSUITE(ErrorClassifier, relay, shieldpool);

} // namespace shieldpool

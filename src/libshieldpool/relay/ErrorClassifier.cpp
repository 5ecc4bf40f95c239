#include "ErrorClassifier.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <string>

namespace shieldpool {
namespace relay {

namespace {

constexpr std::string_view validationPatterns[] = {
    "invalid proof",
    "proof verification failed",
    "invalid signature",
    "simulation failed",
    "instruction error",
    "invalid program",
    "invalid account",
    "account not found",
    "invalid mint",
    "invalid owner",
    "deserialization failed",
    "constraint violation",
    "custom program error",
};

constexpr std::string_view stateConflictPatterns[] = {
    "nullifier already spent",
    "already processed",
    "account already exists",
    "duplicate",
};

constexpr std::string_view resourcePatterns[] = {
    "insufficient funds",
    "insufficient lamports",
    "insufficient balance",
};

constexpr std::string_view transientPatterns[] = {
    "blockhash not found",
    "block height exceeded",
    "transaction expired",
    "node is behind",
    "node is unhealthy",
    "service unavailable",
    "connection refused",
    "connection reset",
    "connection timed out",
    "timeout",
    "etimedout",
    "econnreset",
    "econnrefused",
    "enetunreach",
    "socket hang up",
    "network error",
    "502",
    "503",
    "504",
    "bad gateway",
    "gateway timeout",
    "too many requests",
    "429",
    "rate limit",
    "server too busy",
    "temporarily unavailable",
    "blockhashnotfound",
};

template <std::size_t N>
bool
matches(std::string const& message, std::string_view const (&patterns)[N])
{
    for (auto const& p : patterns)
    {
        if (message.find(p) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace

char const*
to_string(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::Validation:
            return "VALIDATION_ERROR";
        case ErrorCategory::StateConflict:
            return "STATE_CONFLICT";
        case ErrorCategory::Resource:
            return "RESOURCE_ERROR";
        case ErrorCategory::TransientNetwork:
            return "TRANSIENT_RPC";
        case ErrorCategory::Unknown:
            break;
    }
    return "UNKNOWN_ERROR";
}

ErrorCategory
classify(std::string_view message)
{
    auto const lower = boost::algorithm::to_lower_copy(std::string(message));

    if (matches(lower, validationPatterns))
        return ErrorCategory::Validation;
    if (matches(lower, stateConflictPatterns))
        return ErrorCategory::StateConflict;
    if (matches(lower, resourcePatterns))
        return ErrorCategory::Resource;
    if (matches(lower, transientPatterns))
        return ErrorCategory::TransientNetwork;
    return ErrorCategory::Unknown;
}

bool
isRetryable(ErrorCategory category)
{
    return category == ErrorCategory::TransientNetwork || category == ErrorCategory::Unknown;
}

int
httpStatus(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::Validation:
            return 400;
        case ErrorCategory::StateConflict:
            return 409;
        case ErrorCategory::Resource:
            return 422;
        case ErrorCategory::TransientNetwork:
            return 503;
        case ErrorCategory::Unknown:
            break;
    }
    return 500;
}

char const*
publicMessage(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::Validation:
            return "Transaction rejected by the ledger";
        case ErrorCategory::StateConflict:
            return "Nullifier already spent";
        case ErrorCategory::Resource:
            return "Relayer cannot cover this withdrawal right now";
        case ErrorCategory::TransientNetwork:
            return "Ledger temporarily unavailable, try again later";
        case ErrorCategory::Unknown:
            break;
    }
    return "Withdrawal failed";
}

} // namespace relay
} // namespace shieldpool

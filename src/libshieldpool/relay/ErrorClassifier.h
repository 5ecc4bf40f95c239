#pragma once

#include <string_view>

namespace shieldpool {
namespace relay {

/**
    Why a withdrawal was refused. Also decides whether a failed ledger
    submission is worth another attempt.
*/
enum class ErrorCategory {
    Validation,
    StateConflict,
    Resource,
    TransientNetwork,
    Unknown
};

char const*
to_string(ErrorCategory category);

/**
    Case-insensitive substring match of a failure message against fixed
    pattern tables, tried in category order so validation wins ties.
*/
ErrorCategory
classify(std::string_view message);

/** Only transient and unknown failures are retried. */
bool
isRetryable(ErrorCategory category);

int
httpStatus(ErrorCategory category);

/** Client-facing text for a failure that came back from the ledger. */
char const*
publicMessage(ErrorCategory category);

} // namespace relay
} // namespace shieldpool

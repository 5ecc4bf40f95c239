#pragma once

#include <stdexcept>
#include <string>

namespace shieldpool {
namespace zkp {

/**
 * Error types raised by the cryptographic layer.
 *
 * Each one derives from the standard exception that best describes the
 * contract violation so callers that only care about the broad class can
 * keep catching std::out_of_range, std::length_error and friends.
 */

// A value was decoded into a field it does not fit in.
class OutOfRangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// A fixed-size encoding had the wrong number of bytes.
class InvalidLengthError : public std::length_error {
public:
    using std::length_error::length_error;
};

// The hash engine was used before initialize() completed.
class NotInitializedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Authenticated decryption failed. Never carries partial plaintext.
class DecryptionFailedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The note has no ledger position yet.
class MissingLeafIndexError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class TreeFullError : public std::overflow_error {
public:
    using std::overflow_error::overflow_error;
};

class InvalidIndexError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// A supplied commitment does not match the one recomputed from the note.
class CommitmentMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace zkp
} // namespace shieldpool

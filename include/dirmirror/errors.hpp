#pragma once

#include <stdexcept>
#include <string>

namespace dirmirror {

// Retryable failure of a single request or attempt: network error, timeout,
// unexpected status or a local write error.
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised once the run has been cancelled. Never swallowed by retry loops.
class Interrupted : public std::runtime_error {
public:
    Interrupted() : std::runtime_error("interrupted") {}
};

} // namespace dirmirror

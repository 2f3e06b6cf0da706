#pragma once

#include <stdexcept>
#include <string>

namespace flowbench {

/// Invalid configuration (chunk size vs datagram limit, unreadable input,
/// unwritable log). Fatal at startup; no partial run.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Connection attempt failed. Transient: the run controller retries a
/// bounded number of times before treating it as fatal.
class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Transport failure in the middle of a flow (stream write failure,
/// connection drop). Fatal to the flow.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Input payload could not be read after the flow started.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Process exit codes shared by client and server.
enum ExitCode : int {
    kExitOk          = 0,
    kExitConfig      = 2,
    kExitConnect     = 3,
    kExitTransport   = 4,
    kExitInput       = 5,
    kExitInterrupted = 130
};

}  // namespace flowbench

/*
 * Error Taxonomy
 *
 * Exception types shared by the relay server and the peer client.
 * Server-side errors are converted to *-error wire messages for the
 * affected socket only; client-side errors surface through state
 * observers. None of them may terminate the process.
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace errors {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad password or locked-out source address
class AuthenticationError : public Error {
public:
    explicit AuthenticationError(const std::string& what) : Error(what) {}
};

// Unknown target connection ID
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& what) : Error(what) {}
};

// P2P negotiation failure. Always handled by falling back to the relay.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what) : Error(what) {}
};

class ChecksumMismatch : public Error {
public:
    explicit ChecksumMismatch(const std::string& what) : Error(what) {}
};

// Heartbeat or idle timeout, handled exactly like a disconnect
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& what) : Error(what) {}
};

// Rejected before any transfer starts (e.g. file too large)
class CapacityError : public Error {
public:
    explicit CapacityError(const std::string& what) : Error(what) {}
};

// Malformed wire message (bad JSON, missing or mistyped field)
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& what) : Error(what) {}
};

} // namespace errors

#endif // ERRORS_H

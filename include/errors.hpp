#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class of every error raised by the client library.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message) : std::runtime_error(message) {}
};

// Bad constructor/config arguments. Raised before any I/O.
class ValidationError : public ClientError {
public:
    explicit ValidationError(const std::string& message) : ClientError(message) {}
};

// Transport open, authentication failure or transport loss. The client is left Disconnected.
class ConnectionError : public ClientError {
public:
    explicit ConnectionError(const std::string& message) : ClientError(message) {}
};

// No correlated response arrived within the configured window.
class RequestTimeout : public ClientError {
public:
    explicit RequestTimeout(const std::string& message) : ClientError(message) {}
};

// The peer answered with a non-success status.
class RemoteError : public ClientError {
public:
    RemoteError(const std::string& message, std::string remote_message)
        : ClientError(message), remote_message_(std::move(remote_message)) {}

    const std::string& remote_message() const { return remote_message_; }

private:
    std::string remote_message_;
};

// Malformed or unclassifiable inbound frame. Logged by the receive loop, never surfaced to callers.
class ProtocolError : public ClientError {
public:
    explicit ProtocolError(const std::string& message) : ClientError(message) {}
};

#pragma once
// Error taxonomy shared by both sides of the bridge
//
// Transport and Framing are connection-level: a reconnect can cure them, so
// the gateway retries them. Decode, Validation and HandlerFault describe the
// message itself and fail fast.

#include <optional>
#include <stdexcept>
#include <string>

namespace conduit {

enum class ErrorKind {
    Transport,     // connect/read/write timeout, reset, refused
    Framing,       // illegal or truncated length prefix
    Decode,        // payload is not a well-formed envelope
    Validation,    // tool parameter check failed
    HandlerFault   // tool raised, or exceeded its execution deadline
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Framing: return "framing";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::HandlerFault: return "handler_fault";
    }
    return "unknown";
}

inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Transport || kind == ErrorKind::Framing;
}

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransportError : public BridgeError {
public:
    explicit TransportError(const std::string& message)
        : BridgeError(ErrorKind::Transport, message) {}
};

class FramingError : public BridgeError {
public:
    explicit FramingError(const std::string& message)
        : BridgeError(ErrorKind::Framing, message) {}
};

// Carries whatever correlation id could be recovered before decoding failed
class DecodeError : public BridgeError {
public:
    explicit DecodeError(const std::string& message, std::optional<std::string> id = std::nullopt)
        : BridgeError(ErrorKind::Decode, message), id_(std::move(id)) {}

    const std::optional<std::string>& id() const { return id_; }

private:
    std::optional<std::string> id_;
};

} // namespace conduit

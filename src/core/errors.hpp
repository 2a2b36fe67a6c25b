#pragma once

#include <stdexcept>
#include <string>

// Process exit codes
constexpr int EXIT_OK                = 0;
constexpr int EXIT_GENERAL_ERROR     = 1;
constexpr int EXIT_CONFIG_ERROR      = 10;
constexpr int EXIT_AUTH_ERROR        = 11;
constexpr int EXIT_VALIDATION_ERROR  = 12;
constexpr int EXIT_API_ERROR         = 13;
constexpr int EXIT_TIMEOUT           = 14;
constexpr int EXIT_LOG_NOT_FOUND     = 15;

class BridgeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

// Missing or rejected forge credentials. Never retried.
class ForgeAuthError : public ConfigError {
public:
    explicit ForgeAuthError(const std::string& msg, std::string hint = "")
        : ConfigError(msg), hint_(std::move(hint)) {}

    const std::string& hint() const { return hint_; }

private:
    std::string hint_;
};

// Forge API failure. status() is the HTTP status, 0 when none was received.
class ForgeError : public BridgeError {
public:
    explicit ForgeError(const std::string& msg, int status = 0)
        : BridgeError(msg), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// Deadline exceeded while polling a run or waiting for an artifact.
class TimeoutError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

// Direct (tunnel) transport failures. Always recoverable via the Actions path.
class TunnelError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

class TunnelNotAvailableError : public TunnelError {
public:
    using TunnelError::TunnelError;
};

class BridgeNotFoundError : public TunnelError {
public:
    using TunnelError::TunnelError;
};

// Map an exception from the taxonomy onto a process exit code.
int exit_code_for(const std::exception& e);

// Short machine-readable name ("ForgeError", "Timeout", ...).
const char* error_type_name(const std::exception& e);

#include "errors.hpp"

int exit_code_for(const std::exception& e) {
    // Order matters: subclasses before their bases.
    if (dynamic_cast<const ForgeAuthError*>(&e)) return EXIT_AUTH_ERROR;
    if (dynamic_cast<const ConfigError*>(&e)) return EXIT_CONFIG_ERROR;
    if (dynamic_cast<const TimeoutError*>(&e)) return EXIT_TIMEOUT;
    if (dynamic_cast<const ForgeError*>(&e)) return EXIT_API_ERROR;
    if (dynamic_cast<const std::invalid_argument*>(&e)) return EXIT_VALIDATION_ERROR;
    return EXIT_GENERAL_ERROR;
}

const char* error_type_name(const std::exception& e) {
    if (dynamic_cast<const ForgeAuthError*>(&e)) return "AuthError";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    if (dynamic_cast<const TimeoutError*>(&e)) return "Timeout";
    if (dynamic_cast<const ForgeError*>(&e)) return "ForgeError";
    if (dynamic_cast<const BridgeNotFoundError*>(&e)) return "BridgeNotFound";
    if (dynamic_cast<const TunnelNotAvailableError*>(&e)) return "TunnelNotAvailable";
    if (dynamic_cast<const TunnelError*>(&e)) return "TunnelError";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "ValidationError";
    return "Error";
}

#include "gateway_error.H"

namespace predex::gateway {

const char* to_string(GATEWAY_ERROR kind) {
    switch (kind) {
        case GATEWAY_ERROR::TIMEOUT: return "TIMEOUT";
        case GATEWAY_ERROR::RATE_LIMITED: return "RATE_LIMITED";
        case GATEWAY_ERROR::SERVER_ERROR: return "SERVER_ERROR";
        case GATEWAY_ERROR::CLIENT_ERROR: return "CLIENT_ERROR";
        case GATEWAY_ERROR::NETWORK_ERROR: return "NETWORK_ERROR";
        case GATEWAY_ERROR::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

GatewayError::GatewayError(GATEWAY_ERROR kind, const std::string& message, long status_code,
                           std::optional<std::chrono::milliseconds> retry_after)
    : std::runtime_error(message), kind(kind), status_code(status_code), retry_after(retry_after) {}

bool GatewayError::is_retryable() const {
    return kind == GATEWAY_ERROR::TIMEOUT || kind == GATEWAY_ERROR::RATE_LIMITED ||
           kind == GATEWAY_ERROR::SERVER_ERROR || kind == GATEWAY_ERROR::NETWORK_ERROR;
}

GATEWAY_ERROR classify_status(long status_code) {
    if (status_code == 429) {
        return GATEWAY_ERROR::RATE_LIMITED;
    }
    if (status_code == 408) {
        return GATEWAY_ERROR::TIMEOUT;
    }
    if (status_code >= 500) {
        return GATEWAY_ERROR::SERVER_ERROR;
    }
    return GATEWAY_ERROR::CLIENT_ERROR;
}

} // namespace predex::gateway

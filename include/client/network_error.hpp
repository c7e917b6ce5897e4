#ifndef DFP_CLIENT_NETWORK_ERROR_HPP
#define DFP_CLIENT_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dfp::client {

enum class NetworkError {
    SUCCESS = 0,
    CONNECTION_FAILED,
    TIMEOUT,
    HTTP_STATUS,
    PROTOCOL_ERROR,
    INVALID_URL,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CONNECTION_FAILED: return "Connection error";
        case NetworkError::TIMEOUT: return "Timeout error";
        case NetworkError::HTTP_STATUS: return "HTTP status error";
        case NetworkError::PROTOCOL_ERROR: return "Protocol error";
        case NetworkError::INVALID_URL: return "Invalid URL";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

// Failed request, classified for logging and retry decisions
class NetworkFailure : public std::runtime_error {
public:
    NetworkFailure(NetworkError kind, const std::string& message, unsigned http_status = 0)
        : std::runtime_error(std::string(network_error_to_string(kind)) + ": " + message),
          kind_(kind), http_status_(http_status) {}

    NetworkError kind() const { return kind_; }
    // Non-zero only for HTTP_STATUS failures
    unsigned http_status() const { return http_status_; }

private:
    NetworkError kind_;
    unsigned http_status_;
};

} // namespace dfp::client

#endif // DFP_CLIENT_NETWORK_ERROR_HPP

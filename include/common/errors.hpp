#pragma once

#include <string>
#include <stdexcept>
#include <optional>
#include <cstdint>

namespace betarb {

enum class ErrorKind {
    NONE,
    CONFIGURATION,          // No usable credential, invalid config
    UPSTREAM,               // Transport failure, non-success status, bad body
    VALIDATION,             // Too few outcomes, non-positive price or investment
    INSUFFICIENT_BANKROLL,
    NOT_FOUND,
    ALREADY_SETTLED
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::CONFIGURATION: return "configuration";
        case ErrorKind::UPSTREAM: return "upstream";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::INSUFFICIENT_BANKROLL: return "insufficient_bankroll";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::ALREADY_SETTLED: return "already_settled";
    }
    return "unknown";
}

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& what, long http_status = 0)
        : std::runtime_error(what), http_status_(http_status) {}

    // 0 when the request never got a response
    long http_status() const { return http_status_; }

    // Quota headers from a rejected response, when present
    std::optional<int64_t> requests_remaining;
    std::optional<int64_t> requests_used;

private:
    long http_status_;
};

} // namespace betarb

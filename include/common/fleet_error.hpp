/*
 * File: include/common/fleet_error.hpp
 * Project: Signage Fleet Sync
 * Purpose: Error taxonomy shared by the fleet client, cache and dispatcher
 * Notes:
 *  - Transport and decoding layers throw FleetError
 *  - Dispatcher converts it into a CommandResult at its boundary
 * Last updated: 2026-10-18
 */

#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind
{
    Unreachable,
    Unauthorized,
    NotFound,
    ServerError,
    Malformed,
    Rejected,
    InvalidArgument,
    Cancelled
};

inline const char *to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Unreachable:
        return "unreachable";
    case ErrorKind::Unauthorized:
        return "unauthorized";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::ServerError:
        return "server_error";
    case ErrorKind::Malformed:
        return "malformed";
    case ErrorKind::Rejected:
        return "rejected";
    case ErrorKind::InvalidArgument:
        return "invalid_argument";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

// Network failures and 5xx are worth another attempt; everything else is final.
inline bool is_transient(ErrorKind kind)
{
    return kind == ErrorKind::Unreachable || kind == ErrorKind::ServerError;
}

class FleetError : public std::runtime_error
{
public:
    FleetError(ErrorKind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

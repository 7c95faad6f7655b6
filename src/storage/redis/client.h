#pragma once

/// @file client.h
/// @brief Redis client wrapper for the session store

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace insightx::storage {

/// @brief Redis client configuration
struct RedisConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    std::string password;
    int database = 0;

    std::chrono::seconds connection_timeout{5};
    std::chrono::seconds socket_timeout{5};

    /// Default TTL for keys (0 = no expiry)
    std::chrono::seconds default_ttl{0};
};

/// @brief Minimal synchronous Redis client
///
/// One connection guarded by a mutex, so a client may be shared between
/// threads. A command that hits a broken connection drops it; the next
/// command reconnects.
class RedisClient {
public:
    explicit RedisClient(RedisConfig config);
    ~RedisClient();

    // Non-copyable
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    absl::Status Connect();
    absl::Status Ping();

    // ==========================================================================
    // String Operations
    // ==========================================================================

    /// @brief Set a string value
    /// @param ttl Expiry (nullopt = default_ttl, zero = no expiry)
    absl::Status Set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl = std::nullopt);

    /// @return Value if exists, nullopt if not found
    absl::StatusOr<std::optional<std::string>> Get(const std::string& key);

    /// @return true if key was deleted, false if key didn't exist
    absl::StatusOr<bool> Delete(const std::string& key);

private:
    RedisConfig config_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace insightx::storage

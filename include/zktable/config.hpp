#pragma once

#include <chrono>
#include <cstdlib>
#include <string>
#include "coordination.hpp"
#include "errors.hpp"

namespace zktable {

namespace defaults {
    constexpr const char* ENDPOINT = "localhost:2181";
    constexpr const char* BASE_ZNODE = "/wasp";
    constexpr const char* TABLE_ZNODE = "table";
}

// Longest per-call deadline accepted; keeps now() + timeout inside the clock's range.
constexpr std::chrono::milliseconds MAX_CALL_TIMEOUT = std::chrono::hours(24);

/**
 * Reject per-call deadlines outside [0, MAX_CALL_TIMEOUT].
 *
 * @throws InvalidArgumentError if the timeout is negative or too large
 */
inline std::chrono::milliseconds checked_call_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0 || timeout > MAX_CALL_TIMEOUT) {
        throw InvalidArgumentError("call timeout must be between 0 and "
                                   + std::to_string(MAX_CALL_TIMEOUT.count()) + " ms, got "
                                   + std::to_string(timeout.count()));
    }
    return timeout;
}

/**
 * Where the coordination gateway lives and where table nodes are kept.
 */
struct ReaderConfig {
    std::string endpoint = defaults::ENDPOINT;
    std::string base_znode = defaults::BASE_ZNODE;
    std::string table_znode = defaults::TABLE_ZNODE;
    // Zero disables the per-call deadline.
    std::chrono::milliseconds call_timeout{0};

    /**
     * Parent node of every table node, e.g. "/wasp/table".
     */
    std::string tables_root() const {
        return join_path(base_znode, table_znode);
    }

    /**
     * Build a config from environment variables, falling back to defaults.
     *
     * Reads ZKTABLE_ENDPOINT, ZKTABLE_BASE_ZNODE, ZKTABLE_TABLE_ZNODE and
     * ZKTABLE_CALL_TIMEOUT_MS.
     *
     * @throws InvalidArgumentError if the timeout is not an integer in
     *         [0, MAX_CALL_TIMEOUT] milliseconds
     */
    static ReaderConfig from_env() {
        ReaderConfig config;
        config.endpoint = env_or("ZKTABLE_ENDPOINT", defaults::ENDPOINT);
        config.base_znode = env_or("ZKTABLE_BASE_ZNODE", defaults::BASE_ZNODE);
        config.table_znode = env_or("ZKTABLE_TABLE_ZNODE", defaults::TABLE_ZNODE);
        config.call_timeout = parse_timeout(env_or("ZKTABLE_CALL_TIMEOUT_MS", "0"));
        return config;
    }

private:
    static std::string env_or(const char* env_var, const std::string& fallback) {
        const char* value = std::getenv(env_var);
        return value ? value : fallback;
    }

    static std::chrono::milliseconds parse_timeout(const std::string& value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw InvalidArgumentError("ZKTABLE_CALL_TIMEOUT_MS must be a non-negative integer, got '"
                                       + value + "'");
        }
        try {
            return checked_call_timeout(std::chrono::milliseconds(std::stoll(value)));
        } catch (const std::out_of_range&) {
            throw InvalidArgumentError("ZKTABLE_CALL_TIMEOUT_MS out of range: " + value);
        }
    }
};

} // namespace zktable

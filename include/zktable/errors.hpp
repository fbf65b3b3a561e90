#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace zktable {

/**
 * Base exception for all zktable errors.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }

    /**
     * Returns true if the call ran out of time.
     */
    virtual bool is_timeout() const { return false; }

    /**
     * Returns true if stored data could not be interpreted.
     */
    virtual bool is_data_inconsistency() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }
};

/**
 * Base for every failure raised by the coordination-service client layer.
 *
 * The table-state reader never catches or rewraps these; they reach the
 * caller as thrown by the client.
 */
class CoordinationError : public ClientError {
public:
    explicit CoordinationError(const std::string& message)
        : ClientError(message) {}
};

/**
 * Thrown when a gRPC call to the coordination gateway fails.
 */
class GrpcError : public CoordinationError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : CoordinationError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_not_found() const override {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_connection_error() const override {
        return status_code_ == grpc::StatusCode::UNAVAILABLE;
    }

    bool is_timeout() const override {
        return status_code_ == grpc::StatusCode::DEADLINE_EXCEEDED;
    }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when connection to the coordination service is lost or refused.
 *
 * GrpcCoordinationClient reports transport failures as GrpcError instead;
 * this type is for CoordinationClient implementations that hold a session
 * directly (a native ZooKeeper handle, for instance).
 */
class ConnectionError : public CoordinationError {
public:
    explicit ConnectionError(const std::string& message)
        : CoordinationError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown by the codec when a non-empty payload is not a valid table record.
 */
class DecodeError : public ClientError {
public:
    DecodeError(const std::string& reason, std::size_t payload_size)
        : ClientError("cannot decode table state (" + std::to_string(payload_size)
                      + " bytes): " + reason)
        , reason_(reason)
        , payload_size_(payload_size) {}

    const std::string& reason() const { return reason_; }
    std::size_t payload_size() const { return payload_size_; }

private:
    std::string reason_;
    std::size_t payload_size_;
};

/**
 * Thrown when a table node holds a payload that is present but malformed.
 *
 * Distinct from "no recorded state": the node should hold a well-formed
 * record and does not. The decoder's failure is kept as cause().
 */
class DataInconsistencyError : public ClientError {
public:
    DataInconsistencyError(const std::string& path, const DecodeError& cause)
        : ClientError("data inconsistency at " + path + ": " + cause.what())
        , path_(path)
        , cause_(cause) {}

    const std::string& path() const { return path_; }
    const DecodeError& cause() const { return cause_; }

    bool is_data_inconsistency() const override { return true; }

private:
    std::string path_;
    DecodeError cause_;
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public ClientError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : ClientError(message) {}

    bool is_invalid_argument() const override { return true; }
};

} // namespace zktable

#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace murmur {

using TimePoint = std::chrono::system_clock::time_point;
using Embedding = std::vector<float>;

enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    PermissionDenied,
    NotFound,
    NetworkError,
    DatabaseError,
    CorruptedData,
    TransactionFailed,
    OperationCancelled,
    InvalidState,
    InvalidData,
    InternalError,
    NotInitialized,
    Timeout,
    ResourceExhausted,
    // Domain taxonomy
    ConfigurationError,
    ProviderUnavailable,
    InvalidInput,
    DimensionMismatch,
    SyncAlreadyRunning,
    DuplicateExternalId,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::ConfigurationError: return "Configuration error";
        case ErrorCode::ProviderUnavailable: return "Provider unavailable";
        case ErrorCode::InvalidInput: return "Input rejected by provider";
        case ErrorCode::DimensionMismatch: return "Dimension mismatch";
        case ErrorCode::SyncAlreadyRunning: return "Sync already running";
        case ErrorCode::DuplicateExternalId: return "Duplicate external id";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Transient failures are worth retrying; everything else is surfaced as-is.
constexpr bool isTransient(ErrorCode error) {
    return error == ErrorCode::ProviderUnavailable || error == ErrorCode::Timeout ||
           error == ErrorCode::NetworkError || error == ErrorCode::ResourceExhausted;
}

/**
 * A failure: machine-readable code plus a message meant for logs.
 */
struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
};

/**
 * Either a value or an Error. Returned by every fallible operation.
 *
 * value() on an error (or error() on a value) throws std::logic_error; check
 * with has_value() or operator bool first.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(ErrorCode code) : data_(std::in_place_index<1>, code) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        requireValue();
        return *std::get_if<0>(&data_);
    }

    T&& value() && {
        requireValue();
        return std::move(*std::get_if<0>(&data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return *std::get_if<1>(&data_);
    }

private:
    void requireValue() const {
        if (!has_value()) {
            throw std::logic_error("Result holds an error: " + std::get_if<1>(&data_)->message);
        }
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(ErrorCode code) : error_(code) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::logic_error("Result holds an error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::logic_error("Result holds no error");
        }
        return error_;
    }

private:
    Error error_;
};

} // namespace murmur

template <> struct fmt::formatter<murmur::ErrorCode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(murmur::ErrorCode code, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(murmur::errorToString(code), ctx);
    }
};

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::jsonrpc {

/**
 * JSON RPC error code: one tag per reserved value or range, plus a catch-all for application codes.
 * The mapping from integer to tag is total and converts back to the original integer exactly.
 */
class ErrorCode {
  public:
    enum class Kind {
        kParseError,      // Invalid JSON was received by the server
        kInvalidRequest,  // The JSON sent is not a valid Request object
        kMethodNotFound,  // The method does not exist / is not available
        kInvalidParams,   // Invalid method parameter(s)
        kInternalError,   // Internal JSON-RPC error
        kServerError,     // Implementation-defined server error in [-32099, -32000]
        kReserved,        // Any other value in the reserved range [-32768, -32000]
        kOther,           // Application defined
    };

    static constexpr int32_t kParseError = -32700;
    static constexpr int32_t kInvalidRequest = -32600;
    static constexpr int32_t kMethodNotFound = -32601;
    static constexpr int32_t kInvalidParams = -32602;
    static constexpr int32_t kInternalError = -32603;
    static constexpr int32_t kServerErrorMin = -32099;
    static constexpr int32_t kServerErrorMax = -32000;
    static constexpr int32_t kReservedMin = -32768;
    static constexpr int32_t kReservedMax = -32000;

    constexpr ErrorCode() : ErrorCode{kInternalError} {}
    constexpr explicit ErrorCode(int32_t code) : kind_{classify(code)}, code_{code} {}

    static constexpr ErrorCode from_int(int32_t code) { return ErrorCode{code}; }

    constexpr Kind kind() const { return kind_; }
    constexpr int32_t to_int() const { return code_; }

    friend constexpr bool operator==(const ErrorCode&, const ErrorCode&) = default;

  private:
    static constexpr Kind classify(int32_t code) {
        switch (code) {
            case kParseError:
                return Kind::kParseError;
            case kInvalidRequest:
                return Kind::kInvalidRequest;
            case kMethodNotFound:
                return Kind::kMethodNotFound;
            case kInvalidParams:
                return Kind::kInvalidParams;
            case kInternalError:
                return Kind::kInternalError;
            default:
                break;
        }
        if (code >= kServerErrorMin && code <= kServerErrorMax) return Kind::kServerError;
        if (code >= kReservedMin && code <= kReservedMax) return Kind::kReserved;
        return Kind::kOther;
    }

    Kind kind_;
    int32_t code_;
};

std::string to_string(const ErrorCode& code);
std::ostream& operator<<(std::ostream& out, const ErrorCode& code);

//! An error object reported by the remote peer on a response
struct Error {
    ErrorCode code;
    std::string message;
    Value data;

    //! Generic server error with the given message
    static Error custom(std::string message);

    friend bool operator==(const Error&, const Error&) = default;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

void to_json(nlohmann::json& json, const ErrorCode& code);
void from_json(const nlohmann::json& json, ErrorCode& code);

void to_json(nlohmann::json& json, const Error& error);
void from_json(const nlohmann::json& json, Error& error);

//! Well-formed rejection of a single call by the remote peer
class RpcError : public std::runtime_error {
  public:
    explicit RpcError(Error error);

    const Error& error() const noexcept { return error_; }

  private:
    Error error_;
};

}  // namespace ethrpc::jsonrpc

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace ethrpc::jsonrpc {

//! Local failure while encoding or decoding JSON (malformed text or shape mismatch)
class JsonError : public std::runtime_error {
  public:
    explicit JsonError(const std::string& message) : std::runtime_error{message} {}
};

//! Opaque JSON value carried by request params and response results.
//! Conversion to and from typed data goes through the method codec hooks only.
class Value {
  public:
    Value() = default;
    explicit Value(nlohmann::json json) : json_(std::move(json)) {}

    //! Parse a JSON text, throwing JsonError on malformed input
    static Value parse(std::string_view text);

    template <typename T>
    static Value serialize(const T& data) {
        return with([&]() { return nlohmann::json(data); });
    }

    template <typename M>
    static Value for_params(const typename M::Params& params) {
        return with([&]() { return M::serialize_params(params); });
    }

    template <typename M>
    static Value for_result(const typename M::Result& result) {
        return with([&]() { return M::serialize_result(result); });
    }

    template <typename T>
    T deserialize() const {
        return with([&]() { return json_.get<T>(); });
    }

    template <typename M>
    typename M::Params params() const {
        return with([&]() { return M::deserialize_params(json_); });
    }

    template <typename M>
    typename M::Result result() const {
        return with([&]() { return M::deserialize_result(json_); });
    }

    const nlohmann::json& json() const noexcept { return json_; }
    bool is_null() const noexcept { return json_.is_null(); }

    std::string dump() const;

    friend bool operator==(const Value&, const Value&) = default;

  private:
    //! Run the codec function translating any nlohmann failure into JsonError
    template <typename F>
    static auto with(F&& codec) -> decltype(codec()) {
        try {
            return codec();
        } catch (const nlohmann::json::exception& e) {
            throw JsonError{e.what()};
        }
    }

    nlohmann::json json_;
};

std::ostream& operator<<(std::ostream& out, const Value& value);

void to_json(nlohmann::json& json, const Value& value);
void from_json(const nlohmann::json& json, Value& value);

}  // namespace ethrpc::jsonrpc

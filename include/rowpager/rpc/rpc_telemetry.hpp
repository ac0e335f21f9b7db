#pragma once

#include "rowpager/rpc/rpc_errors.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace rowpager::rpc {

struct RpcMethodTelemetrySnapshot final {
    std::uint64_t attempts = 0U;
    std::uint64_t successes = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

struct RpcFailureTelemetrySnapshot final {
    std::uint64_t parse_errors = 0U;
    std::uint64_t invalid_requests = 0U;
    std::uint64_t method_not_found = 0U;
    std::uint64_t invalid_params = 0U;
    std::uint64_t internal_errors = 0U;
};

struct RpcTelemetrySnapshot final {
    std::map<std::string, RpcMethodTelemetrySnapshot, std::less<>> methods{};
    RpcFailureTelemetrySnapshot failures{};
    std::uint64_t suppressed_responses = 0U;
};

class RpcTelemetry final {
public:
    void record_attempt(std::string_view method);
    void record_success(std::string_view method, std::uint64_t duration_ns);

    // An empty method name records only the failure kind; used for parse
    // errors and malformed envelopes that never named a method.
    void record_failure(std::string_view method, RpcErrc kind, std::uint64_t duration_ns);
    void record_suppressed();

    [[nodiscard]] RpcTelemetrySnapshot snapshot() const;
    void reset();

private:
    RpcMethodTelemetrySnapshot& method_entry(std::string_view method);

    mutable std::mutex mutex_{};
    RpcTelemetrySnapshot state_{};
};

}  // namespace rowpager::rpc

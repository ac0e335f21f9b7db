#pragma once

#include "rowpager/rpc/method_registry.hpp"
#include "rowpager/rpc/rpc_errors.hpp"
#include "rowpager/rpc/rpc_telemetry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace rowpager::rpc {

struct CallMetrics final {
    std::string correlation_id{};
    std::string method{};
    std::string request_id{};
    bool notification = false;
    bool success = false;
    bool response_suppressed = false;
    int error_code = 0;
    std::string error_message{};
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// The failure message followed by one "caused by:" line per nested
// exception. std::system_error levels are prefixed with [category:code].
[[nodiscard]] std::string describe_failure(const std::exception& error);

[[nodiscard]] Json make_error_response(const Json& id, RpcErrc kind, const std::string& message, const std::string& trace);
[[nodiscard]] Json make_result_response(const Json& id, Json result);

// Throws RpcError(InvalidRequest) when the envelope is malformed.
void validate_envelope(const Json& request);

class RpcDispatcher final {
public:
    struct Config final {
        const MethodRegistry* registry = nullptr;
        std::function<void(const CallMetrics&)> call_logger{};
    };

    explicit RpcDispatcher(Config config);

    RpcDispatcher(const RpcDispatcher&) = delete;
    RpcDispatcher& operator=(const RpcDispatcher&) = delete;
    RpcDispatcher(RpcDispatcher&&) = delete;
    RpcDispatcher& operator=(RpcDispatcher&&) = delete;

    // Decodes a raw request body and returns the encoded reply, or
    // std::nullopt when nothing is to be sent back. Bodies are handled one
    // at a time; a batch is never interleaved with another request.
    [[nodiscard]] std::optional<std::string> handle_body(std::string_view body);

    [[nodiscard]] const RpcTelemetry& telemetry() const noexcept { return telemetry_; }

private:
    [[nodiscard]] std::optional<Json> handle_locked(const Json& request);
    [[nodiscard]] std::optional<Json> process_request(const Json& request);
    [[nodiscard]] Json protocol_failure(RpcErrc kind, const std::exception& error);
    [[nodiscard]] std::string next_correlation_id();
    void finalize(CallMetrics& metrics, std::chrono::steady_clock::time_point start);

    Config config_{};
    std::mutex mutex_{};
    RpcTelemetry telemetry_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace rowpager::rpc

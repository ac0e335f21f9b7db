#include "rowpager/rpc/rpc_telemetry.hpp"

namespace rowpager::rpc {

RpcMethodTelemetrySnapshot& RpcTelemetry::method_entry(std::string_view method)
{
    auto it = state_.methods.find(method);
    if (it == state_.methods.end()) {
        it = state_.methods.emplace(std::string{method}, RpcMethodTelemetrySnapshot{}).first;
    }
    return it->second;
}

void RpcTelemetry::record_attempt(std::string_view method)
{
    std::lock_guard guard(mutex_);
    method_entry(method).attempts += 1U;
}

void RpcTelemetry::record_success(std::string_view method, std::uint64_t duration_ns)
{
    std::lock_guard guard(mutex_);
    auto& entry = method_entry(method);
    entry.successes += 1U;
    entry.total_duration_ns += duration_ns;
    entry.last_duration_ns = duration_ns;
}

void RpcTelemetry::record_failure(std::string_view method, RpcErrc kind, std::uint64_t duration_ns)
{
    std::lock_guard guard(mutex_);
    if (!method.empty()) {
        auto& entry = method_entry(method);
        entry.failures += 1U;
        entry.total_duration_ns += duration_ns;
        entry.last_duration_ns = duration_ns;
    }

    auto& failures = state_.failures;
    switch (kind) {
    case RpcErrc::ParseError:
        failures.parse_errors += 1U;
        break;
    case RpcErrc::InvalidRequest:
        failures.invalid_requests += 1U;
        break;
    case RpcErrc::MethodNotFound:
        failures.method_not_found += 1U;
        break;
    case RpcErrc::InvalidParams:
        failures.invalid_params += 1U;
        break;
    case RpcErrc::InternalError:
    default:
        failures.internal_errors += 1U;
        break;
    }
}

void RpcTelemetry::record_suppressed()
{
    std::lock_guard guard(mutex_);
    state_.suppressed_responses += 1U;
}

RpcTelemetrySnapshot RpcTelemetry::snapshot() const
{
    std::lock_guard guard(mutex_);
    return state_;
}

void RpcTelemetry::reset()
{
    std::lock_guard guard(mutex_);
    state_ = RpcTelemetrySnapshot{};
}

}  // namespace rowpager::rpc

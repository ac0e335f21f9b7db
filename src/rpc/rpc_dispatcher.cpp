#include "rowpager/rpc/rpc_dispatcher.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace rowpager::rpc {

namespace {

constexpr const char* kProtocolVersion = "2.0";

void append_cause(const std::exception& error, std::string& out, std::size_t depth)
{
    if (depth > 0U) {
        out.append("\ncaused by: ");
    }
    if (const auto* system_error = dynamic_cast<const std::system_error*>(&error)) {
        out.push_back('[');
        out.append(system_error->code().category().name());
        out.push_back(':');
        out.append(std::to_string(system_error->code().value()));
        out.append("] ");
    }
    out.append(error.what());

    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& nested) {
        append_cause(nested, out, depth + 1U);
    } catch (...) {
        out.append("\ncaused by: non-standard exception");
    }
}

[[nodiscard]] std::string id_to_text(const Json& id)
{
    if (id.is_null()) {
        return {};
    }
    if (id.is_string()) {
        return id.get<std::string>();
    }
    return id.dump();
}

[[nodiscard]] std::uint64_t to_nanoseconds(double duration_ms) noexcept
{
    return duration_ms <= 0.0 ? 0U : static_cast<std::uint64_t>(duration_ms * 1'000'000.0);
}

}  // namespace

std::string describe_failure(const std::exception& error)
{
    std::string trace;
    append_cause(error, trace, 0U);
    return trace;
}

Json make_error_response(const Json& id, RpcErrc kind, const std::string& message, const std::string& trace)
{
    Json data = Json::object();
    data["message"] = message;
    data["stacktrace"] = trace;

    Json error = Json::object();
    error["code"] = static_cast<int>(kind);
    error["message"] = std::string{rpc_error_message(kind)};
    error["data"] = std::move(data);

    Json response = Json::object();
    response["jsonrpc"] = kProtocolVersion;
    response["id"] = id;
    response["error"] = std::move(error);
    return response;
}

Json make_result_response(const Json& id, Json result)
{
    Json response = Json::object();
    response["jsonrpc"] = kProtocolVersion;
    response["id"] = id;
    response["result"] = std::move(result);
    return response;
}

void validate_envelope(const Json& request)
{
    if (!request.is_object()) {
        throw RpcError(RpcErrc::InvalidRequest, "Invalid request: must be an object");
    }

    const auto version = request.find("jsonrpc");
    if (version == request.end() || !version->is_string() || *version != kProtocolVersion) {
        throw RpcError(RpcErrc::InvalidRequest, "Invalid jsonrpc: must be \"2.0\"");
    }

    const auto id = request.find("id");
    if (id != request.end() && !(id->is_null() || id->is_string() || id->is_number())) {
        throw RpcError(RpcErrc::InvalidRequest, "Invalid id: must be null, string or number");
    }

    const auto method = request.find("method");
    if (method == request.end() || !method->is_string()) {
        throw RpcError(RpcErrc::InvalidRequest, "Invalid method: must be string");
    }

    const auto params = request.find("params");
    if (params != request.end() && !(params->is_array() || params->is_object())) {
        throw RpcError(RpcErrc::InvalidRequest, "Invalid params: must be array or object");
    }
}

RpcDispatcher::RpcDispatcher(Config config)
    : config_{std::move(config)}
{
    if (config_.registry == nullptr) {
        throw std::invalid_argument("RpcDispatcher requires a method registry");
    }
}

std::string RpcDispatcher::next_correlation_id()
{
    return "rpc-" + std::to_string(correlation_counter_.fetch_add(1U, std::memory_order_relaxed));
}

void RpcDispatcher::finalize(CallMetrics& metrics, std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.finished_at = std::chrono::system_clock::now();

    if (config_.call_logger) {
        config_.call_logger(metrics);
    }
}

Json RpcDispatcher::protocol_failure(RpcErrc kind, const std::exception& error)
{
    CallMetrics metrics{};
    metrics.correlation_id = next_correlation_id();
    metrics.started_at = std::chrono::system_clock::now();
    metrics.error_code = static_cast<int>(kind);

    const auto* rpc_error = dynamic_cast<const RpcError*>(&error);
    metrics.error_message = (rpc_error != nullptr) ? rpc_error->detail() : std::string{error.what()};

    finalize(metrics, std::chrono::steady_clock::now());
    telemetry_.record_failure({}, kind, 0U);

    return make_error_response(nullptr, kind, metrics.error_message, describe_failure(error));
}

std::optional<std::string> RpcDispatcher::handle_body(std::string_view body)
{
    std::lock_guard guard(mutex_);

    Json request;
    try {
        request = Json::parse(body);
    } catch (const Json::exception& error) {
        // parse_error, and out_of_range for numbers that overflow a double
        return protocol_failure(RpcErrc::ParseError, error).dump(-1, ' ', false, Json::error_handler_t::replace);
    }

    auto response = handle_locked(request);
    if (!response) {
        return std::nullopt;
    }
    return response->dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::optional<Json> RpcDispatcher::handle_locked(const Json& request)
{
    if (request.is_object()) {
        return process_request(request);
    }

    if (request.is_array() && !request.empty()) {
        Json responses = Json::array();
        for (const auto& entry : request) {
            auto response = process_request(entry);
            if (response) {
                responses.push_back(std::move(*response));
            }
        }
        if (responses.empty()) {
            return std::nullopt;
        }
        return responses;
    }

    const RpcError error{RpcErrc::InvalidRequest, "Invalid request: must be an object or a non-empty array"};
    return protocol_failure(RpcErrc::InvalidRequest, error);
}

std::optional<Json> RpcDispatcher::process_request(const Json& request)
{
    try {
        validate_envelope(request);
    } catch (const RpcError& error) {
        return protocol_failure(RpcErrc::InvalidRequest, error);
    }

    CallMetrics metrics{};
    metrics.correlation_id = next_correlation_id();
    metrics.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    const auto id_it = request.find("id");
    const Json id = (id_it != request.end()) ? *id_it : Json(nullptr);
    metrics.request_id = id_to_text(id);
    metrics.notification = id.is_null();
    metrics.method = request.at("method").get<std::string>();

    const auto params_it = request.find("params");
    const Json* params = (params_it != request.end()) ? &*params_it : nullptr;

    const bool known_method = config_.registry->find(metrics.method) != nullptr;
    if (known_method) {
        telemetry_.record_attempt(metrics.method);
    }

    Json result;
    std::optional<RpcErrc> failure{};
    std::string trace;
    try {
        result = config_.registry->invoke(metrics.method, params);
    } catch (const RpcError& error) {
        failure = error.kind();
        metrics.error_message = error.detail();
        trace = describe_failure(error);
    } catch (const std::exception& error) {
        failure = RpcErrc::InternalError;
        metrics.error_message = error.what();
        trace = describe_failure(error);
    } catch (...) {
        failure = RpcErrc::InternalError;
        metrics.error_message = "non-standard exception";
        trace = metrics.error_message;
    }

    metrics.success = !failure.has_value();
    metrics.error_code = failure ? static_cast<int>(*failure) : 0;
    metrics.response_suppressed = metrics.notification;
    finalize(metrics, start);

    const auto duration_ns = to_nanoseconds(metrics.duration_ms);
    if (failure) {
        telemetry_.record_failure(known_method ? std::string_view{metrics.method} : std::string_view{}, *failure, duration_ns);
    } else {
        telemetry_.record_success(metrics.method, duration_ns);
    }

    if (metrics.notification) {
        telemetry_.record_suppressed();
        return std::nullopt;
    }
    if (failure) {
        return make_error_response(id, *failure, metrics.error_message, trace);
    }
    return make_result_response(id, std::move(result));
}

}  // namespace rowpager::rpc

#include "rowpager/tools/call_log_formatter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace rowpager::tools {

namespace {

[[nodiscard]] rpc::Json timestamp_or_null(std::chrono::system_clock::time_point tp)
{
    auto text = format_timestamp_iso(tp);
    if (text.empty()) {
        return nullptr;
    }
    return text;
}

}  // namespace

std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

std::string format_call_log_json(const rowpager::rpc::CallMetrics& metrics)
{
    rpc::Json record = rpc::Json::object();
    record["correlation_id"] = metrics.correlation_id;
    record["method"] = metrics.method;
    record["request_id"] = metrics.request_id;
    record["notification"] = metrics.notification;
    record["success"] = metrics.success;
    record["response_suppressed"] = metrics.response_suppressed;
    if (metrics.success) {
        record["error_code"] = nullptr;
        record["error_message"] = nullptr;
    } else {
        record["error_code"] = metrics.error_code;
        record["error_message"] = metrics.error_message;
    }
    record["duration_ms"] = metrics.duration_ms;
    record["started_at"] = timestamp_or_null(metrics.started_at);
    record["finished_at"] = timestamp_or_null(metrics.finished_at);
    return record.dump(-1, ' ', false, rpc::Json::error_handler_t::replace);
}

}  // namespace rowpager::tools

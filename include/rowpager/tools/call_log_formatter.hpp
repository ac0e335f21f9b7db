#pragma once

#include "rowpager/rpc/rpc_dispatcher.hpp"

#include <chrono>
#include <string>

namespace rowpager::tools {

// Empty string for a default-constructed time point.
[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp);

[[nodiscard]] std::string format_call_log_json(const rowpager::rpc::CallMetrics& metrics);

}  // namespace rowpager::tools

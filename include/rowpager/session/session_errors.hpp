#pragma once

#include <system_error>

namespace rowpager::session {

enum class SessionErrc {
    Success = 0,
    ExecuteWhileActive,
    NoActiveQuery,
    InvalidPageSize,
    ConnectionClosed,
    QuitWhileActive
};

const std::error_category& session_error_category() noexcept;
std::error_code make_error_code(SessionErrc value) noexcept;

}  // namespace rowpager::session

namespace std {

template <>
struct is_error_code_enum<rowpager::session::SessionErrc> : true_type {
};

}  // namespace std

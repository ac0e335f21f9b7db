#pragma once

#include <system_error>

namespace rowpager::driver {

enum class DriverErrc {
    Success = 0,
    OpenFailed,
    PrepareFailed,
    StepFailed,
    CursorClosed,
    ConnectionClosed,
    MultipleStatements,
    NoStatement
};

const std::error_category& driver_error_category() noexcept;
std::error_code make_error_code(DriverErrc value) noexcept;

}  // namespace rowpager::driver

namespace std {

template <>
struct is_error_code_enum<rowpager::driver::DriverErrc> : true_type {
};

}  // namespace std

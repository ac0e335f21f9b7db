#include "rowpager/driver/driver_errors.hpp"

namespace rowpager::driver {

namespace {

class DriverErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowpager.driver";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<DriverErrc>(condition)) {
        case DriverErrc::Success:
            return "success";
        case DriverErrc::OpenFailed:
            return "failed to open connection";
        case DriverErrc::PrepareFailed:
            return "failed to prepare statement";
        case DriverErrc::StepFailed:
            return "failed to step statement";
        case DriverErrc::CursorClosed:
            return "cursor is closed";
        case DriverErrc::ConnectionClosed:
            return "connection is closed";
        case DriverErrc::MultipleStatements:
            return "multiple statements are not supported";
        case DriverErrc::NoStatement:
            return "no statement to execute";
        default:
            return "unknown driver error";
        }
    }
};

const DriverErrorCategory kCategory{};

}  // namespace

const std::error_category& driver_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(DriverErrc value) noexcept
{
    return {static_cast<int>(value), driver_error_category()};
}

}  // namespace rowpager::driver

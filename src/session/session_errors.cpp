#include "rowpager/session/session_errors.hpp"

namespace rowpager::session {

namespace {

class SessionErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowpager.session";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SessionErrc>(condition)) {
        case SessionErrc::Success:
            return "success";
        case SessionErrc::ExecuteWhileActive:
            return "cannot execute while a query is active";
        case SessionErrc::NoActiveQuery:
            return "no active query";
        case SessionErrc::InvalidPageSize:
            return "page size must be a positive integer";
        case SessionErrc::ConnectionClosed:
            return "connection is closed";
        case SessionErrc::QuitWhileActive:
            return "cannot quit while a query is active";
        default:
            return "unknown session error";
        }
    }
};

const SessionErrorCategory kCategory{};

}  // namespace

const std::error_category& session_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(SessionErrc value) noexcept
{
    return {static_cast<int>(value), session_error_category()};
}

}  // namespace rowpager::session

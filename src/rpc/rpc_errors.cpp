#include "rowpager/rpc/rpc_errors.hpp"

#include <utility>

namespace rowpager::rpc {

namespace {

class RpcErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowpager.rpc";
    }

    std::string message(int condition) const override
    {
        return std::string{rpc_error_message(static_cast<RpcErrc>(condition))};
    }
};

const RpcErrorCategory kCategory{};

}  // namespace

const std::error_category& rpc_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(RpcErrc value) noexcept
{
    return {static_cast<int>(value), rpc_error_category()};
}

std::string_view rpc_error_message(RpcErrc value) noexcept
{
    switch (value) {
    case RpcErrc::ParseError:
        return "Parse error";
    case RpcErrc::InvalidRequest:
        return "Invalid Request";
    case RpcErrc::MethodNotFound:
        return "Method not found";
    case RpcErrc::InvalidParams:
        return "Invalid params";
    case RpcErrc::InternalError:
        return "Internal error";
    default:
        return "Unknown error";
    }
}

RpcError::RpcError(RpcErrc kind, std::string detail)
    : std::system_error{make_error_code(kind), detail}
    , kind_{kind}
    , detail_{std::move(detail)}
{
}

}  // namespace rowpager::rpc

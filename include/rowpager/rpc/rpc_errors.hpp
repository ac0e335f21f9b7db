#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace rowpager::rpc {

// Values are the JSON-RPC 2.0 error codes.
enum class RpcErrc {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

const std::error_category& rpc_error_category() noexcept;
std::error_code make_error_code(RpcErrc value) noexcept;

// Standard message text placed in the "message" member of an error object.
[[nodiscard]] std::string_view rpc_error_message(RpcErrc value) noexcept;

class RpcError final : public std::system_error {
public:
    RpcError(RpcErrc kind, std::string detail);

    [[nodiscard]] RpcErrc kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    RpcErrc kind_;
    std::string detail_;
};

}  // namespace rowpager::rpc

namespace std {

template <>
struct is_error_code_enum<rowpager::rpc::RpcErrc> : true_type {
};

}  // namespace std

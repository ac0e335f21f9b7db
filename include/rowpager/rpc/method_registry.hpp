#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rowpager::rpc {

using Json = nlohmann::ordered_json;

enum class ParamType : std::uint8_t {
    Any = 0,
    String,
    Integer
};

[[nodiscard]] std::string_view param_type_to_string(ParamType type) noexcept;

struct ParamSpec final {
    std::string name{};
    ParamType type = ParamType::Any;
};

using Arguments = std::vector<Json>;
using MethodHandler = std::function<Json(const Arguments&)>;

struct MethodSpec final {
    std::string name{};
    std::vector<ParamSpec> params{};
    MethodHandler handler{};
};

// Fixed table of callable methods. The declared parameter list is what
// positional and named arguments are checked against before a handler runs.
class MethodRegistry final {
public:
    MethodRegistry() = default;

    MethodRegistry(const MethodRegistry&) = delete;
    MethodRegistry& operator=(const MethodRegistry&) = delete;
    MethodRegistry(MethodRegistry&&) = default;
    MethodRegistry& operator=(MethodRegistry&&) = default;

    void register_method(std::string name, std::vector<ParamSpec> params, MethodHandler handler);

    [[nodiscard]] const MethodSpec* find(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::string> method_names() const;
    [[nodiscard]] std::size_t size() const noexcept { return methods_.size(); }

    // params is null when the request carried no "params" member. Throws
    // RpcError(InvalidParams) on an arity, name or type mismatch.
    [[nodiscard]] static Arguments bind_arguments(const MethodSpec& spec, const Json* params);

    // Throws RpcError(MethodNotFound) for unknown names; handler exceptions
    // propagate unchanged.
    [[nodiscard]] Json invoke(std::string_view name, const Json* params) const;

private:
    std::map<std::string, MethodSpec, std::less<>> methods_{};
};

}  // namespace rowpager::rpc

#include "rowpager/rpc/method_registry.hpp"

#include "rowpager/rpc/rpc_errors.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace rowpager::rpc {

namespace {

[[nodiscard]] bool matches_type(const Json& value, ParamType type) noexcept
{
    switch (type) {
    case ParamType::String:
        return value.is_string();
    case ParamType::Integer:
        return value.is_number_integer();
    case ParamType::Any:
    default:
        return true;
    }
}

void check_argument(const MethodSpec& spec, const ParamSpec& param, const Json& value)
{
    if (matches_type(value, param.type)) {
        return;
    }

    std::ostringstream message;
    message << spec.name << "() argument '" << param.name << "' must be " << param_type_to_string(param.type)
            << ", got " << value.type_name();
    throw RpcError(RpcErrc::InvalidParams, message.str());
}

[[nodiscard]] std::string arity_message(const MethodSpec& spec, std::size_t given)
{
    std::ostringstream message;
    message << spec.name << "() takes " << spec.params.size() << " argument" << (spec.params.size() == 1U ? "" : "s")
            << " but " << given << (given == 1U ? " was" : " were") << " given";
    return message.str();
}

}  // namespace

std::string_view param_type_to_string(ParamType type) noexcept
{
    switch (type) {
    case ParamType::String:
        return "string";
    case ParamType::Integer:
        return "integer";
    case ParamType::Any:
    default:
        return "any";
    }
}

void MethodRegistry::register_method(std::string name, std::vector<ParamSpec> params, MethodHandler handler)
{
    if (name.empty()) {
        throw std::invalid_argument("method name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("method '" + name + "' requires a handler");
    }
    if (methods_.find(name) != methods_.end()) {
        throw std::invalid_argument("method '" + name + "' is already registered");
    }

    MethodSpec spec{};
    spec.name = name;
    spec.params = std::move(params);
    spec.handler = std::move(handler);
    methods_.emplace(std::move(name), std::move(spec));
}

const MethodSpec* MethodRegistry::find(std::string_view name) const noexcept
{
    const auto it = methods_.find(name);
    if (it == methods_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> MethodRegistry::method_names() const
{
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& [name, _] : methods_) {
        names.push_back(name);
    }
    return names;
}

Arguments MethodRegistry::bind_arguments(const MethodSpec& spec, const Json* params)
{
    Arguments arguments;
    if (params == nullptr) {
        if (!spec.params.empty()) {
            throw RpcError(RpcErrc::InvalidParams, arity_message(spec, 0U));
        }
        return arguments;
    }

    if (params->is_array()) {
        if (params->size() != spec.params.size()) {
            throw RpcError(RpcErrc::InvalidParams, arity_message(spec, params->size()));
        }
        arguments.reserve(spec.params.size());
        for (std::size_t index = 0U; index < spec.params.size(); ++index) {
            const auto& value = (*params)[index];
            check_argument(spec, spec.params[index], value);
            arguments.push_back(value);
        }
        return arguments;
    }

    if (params->is_object()) {
        for (const auto& [key, _] : params->items()) {
            bool declared = false;
            for (const auto& param : spec.params) {
                if (param.name == key) {
                    declared = true;
                    break;
                }
            }
            if (!declared) {
                throw RpcError(RpcErrc::InvalidParams, spec.name + "() got an unexpected argument '" + key + "'");
            }
        }

        arguments.reserve(spec.params.size());
        for (const auto& param : spec.params) {
            const auto it = params->find(param.name);
            if (it == params->end()) {
                throw RpcError(RpcErrc::InvalidParams, spec.name + "() missing argument '" + param.name + "'");
            }
            check_argument(spec, param, *it);
            arguments.push_back(*it);
        }
        return arguments;
    }

    throw RpcError(RpcErrc::InvalidParams, "params must be an array or an object");
}

Json MethodRegistry::invoke(std::string_view name, const Json* params) const
{
    const auto* spec = find(name);
    if (spec == nullptr) {
        throw RpcError(RpcErrc::MethodNotFound, "unknown method '" + std::string{name} + "'");
    }

    const auto arguments = bind_arguments(*spec, params);
    return spec->handler(arguments);
}

}  // namespace rowpager::rpc

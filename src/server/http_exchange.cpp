#include "rowpager/server/http_exchange.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>

namespace rowpager::server {

namespace http = boost::beast::http;

namespace {

constexpr std::string_view kJsonMediaType = "application/json";

void apply_cors_headers(HttpResponse& response)
{
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    response.set(http::field::access_control_max_age, "86400");
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1U);
    }
    return text;
}

}  // namespace

bool is_json_content_type(std::string_view value) noexcept
{
    const auto separator = value.find(';');
    const auto media_type = trim(value.substr(0U, separator));
    return media_type.size() == kJsonMediaType.size() &&
           std::equal(media_type.begin(), media_type.end(), kJsonMediaType.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == b;
           });
}

HttpResponse make_status_response(http::status status, std::string_view text, unsigned version, bool keep_alive)
{
    HttpResponse response{status, version};
    response.set(http::field::content_type, "text/plain");
    response.keep_alive(keep_alive);
    response.body() = std::string{text};
    response.prepare_payload();
    return response;
}

HttpResponse make_http_response(const HttpRequest& request, const BodyHandler& handler)
{
    const auto version = request.version();
    const bool keep_alive = request.keep_alive();

    if (request.method() == http::verb::options) {
        HttpResponse response{http::status::ok, version};
        apply_cors_headers(response);
        response.keep_alive(keep_alive);
        response.prepare_payload();
        return response;
    }

    if (request.method() != http::verb::post) {
        auto response = make_status_response(http::status::method_not_allowed, "Method Must Be POST Or OPTIONS", version, keep_alive);
        response.set(http::field::allow, "POST, OPTIONS");
        return response;
    }

    if (request.target() != "/") {
        std::cerr << "[info] rejected request path " << request.target() << '\n';
        return make_status_response(http::status::not_found, "Request Must Have Path Of /", version, keep_alive);
    }

    const auto content_type = request.find(http::field::content_type);
    if (content_type == request.end() ||
        !is_json_content_type(std::string_view{content_type->value().data(), content_type->value().size()})) {
        std::cerr << "[info] rejected request content type for " << request.target() << '\n';
        return make_status_response(http::status::bad_request, "Content-Type Must Be application/json", version, keep_alive);
    }

    std::optional<std::string> body;
    try {
        body = handler(request.body());
    } catch (const std::exception& error) {
        std::cerr << "error: request handler failed: " << error.what() << '\n';
        return make_status_response(http::status::internal_server_error, "Internal Server Error", version, false);
    }

    HttpResponse response{http::status::ok, version};
    apply_cors_headers(response);
    response.keep_alive(keep_alive);
    if (body) {
        response.set(http::field::content_type, "application/json");
        response.body() = std::move(*body);
    }
    response.prepare_payload();
    return response;
}

}  // namespace rowpager::server

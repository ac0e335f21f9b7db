#pragma once

#include <boost/beast/http.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rowpager::server {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Receives a raw JSON-RPC body; std::nullopt means "reply with an empty 200".
using BodyHandler = std::function<std::optional<std::string>(std::string_view)>;

// Accepts application/json with optional parameters, case-insensitively.
[[nodiscard]] bool is_json_content_type(std::string_view value) noexcept;

[[nodiscard]] HttpResponse make_status_response(boost::beast::http::status status,
                                                std::string_view text,
                                                unsigned version,
                                                bool keep_alive);

// Transport-level validation, CORS and framing for one parsed request.
// Path and content-type violations never reach the handler.
[[nodiscard]] HttpResponse make_http_response(const HttpRequest& request, const BodyHandler& handler);

}  // namespace rowpager::server

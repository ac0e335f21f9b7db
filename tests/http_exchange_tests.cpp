#include "rowpager/server/http_exchange.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace rowpager::server;
namespace http = boost::beast::http;

namespace {

struct HandlerProbe final {
    BodyHandler handler()
    {
        return [this](std::string_view body) -> std::optional<std::string> {
            ++calls;
            last_body = std::string{body};
            return reply;
        };
    }

    int calls = 0;
    std::string last_body{};
    std::optional<std::string> reply{R"({"jsonrpc":"2.0","id":1,"result":true})"};
};

HttpRequest make_request(http::verb verb, std::string target, std::string content_type, std::string body = {})
{
    HttpRequest request{verb, target, 11};
    if (!content_type.empty()) {
        request.set(http::field::content_type, content_type);
    }
    request.body() = std::move(body);
    request.prepare_payload();
    return request;
}

void check_cors(const HttpResponse& response)
{
    CHECK(response[http::field::access_control_allow_origin] == "*");
    CHECK(response[http::field::access_control_allow_methods] == "POST, OPTIONS");
    CHECK(response[http::field::access_control_allow_headers] == "Content-Type");
    CHECK(response[http::field::access_control_max_age] == "86400");
}

}  // namespace

TEST_CASE("is_json_content_type accepts parameters and any case")
{
    CHECK(is_json_content_type("application/json"));
    CHECK(is_json_content_type("Application/JSON"));
    CHECK(is_json_content_type("application/json; charset=utf-8"));
    CHECK(is_json_content_type("  application/json ;charset=UTF-8"));
    CHECK_FALSE(is_json_content_type("text/plain"));
    CHECK_FALSE(is_json_content_type("application/jsonp"));
    CHECK_FALSE(is_json_content_type(""));
}

TEST_CASE("make_http_response answers preflight requests")
{
    HandlerProbe probe;
    const auto response = make_http_response(make_request(http::verb::options, "/", ""), probe.handler());

    CHECK(response.result() == http::status::ok);
    CHECK(response.body().empty());
    check_cors(response);
    CHECK(probe.calls == 0);
}

TEST_CASE("make_http_response forwards JSON bodies to the handler")
{
    HandlerProbe probe;
    const auto request = make_request(http::verb::post, "/", "application/json", R"({"jsonrpc":"2.0"})");
    const auto response = make_http_response(request, probe.handler());

    CHECK(probe.calls == 1);
    CHECK(probe.last_body == R"({"jsonrpc":"2.0"})");
    CHECK(response.result() == http::status::ok);
    CHECK(response[http::field::content_type] == "application/json");
    CHECK(response.body() == *probe.reply);
    CHECK(response[http::field::content_length] == std::to_string(probe.reply->size()));
    CHECK(response.keep_alive());
    check_cors(response);
}

TEST_CASE("make_http_response sends an empty 200 when nothing is returned")
{
    HandlerProbe probe;
    probe.reply.reset();
    const auto response =
        make_http_response(make_request(http::verb::post, "/", "application/json", "[]"), probe.handler());

    CHECK(response.result() == http::status::ok);
    CHECK(response.body().empty());
    CHECK(response[http::field::content_length] == "0");
    CHECK(response.find(http::field::content_type) == response.end());
    check_cors(response);
}

TEST_CASE("make_http_response rejects requests off the root path")
{
    HandlerProbe probe;
    const auto response =
        make_http_response(make_request(http::verb::post, "/rpc", "application/json", "{}"), probe.handler());

    CHECK(response.result() == http::status::not_found);
    CHECK(response.body() == "Request Must Have Path Of /");
    CHECK(probe.calls == 0);
}

TEST_CASE("make_http_response rejects non-JSON content types")
{
    HandlerProbe probe;

    SECTION("wrong media type")
    {
        const auto response =
            make_http_response(make_request(http::verb::post, "/", "text/plain", "{}"), probe.handler());
        CHECK(response.result() == http::status::bad_request);
        CHECK(response.body() == "Content-Type Must Be application/json");
    }

    SECTION("missing header")
    {
        const auto response = make_http_response(make_request(http::verb::post, "/", "", "{}"), probe.handler());
        CHECK(response.result() == http::status::bad_request);
    }

    CHECK(probe.calls == 0);
}

TEST_CASE("make_http_response only allows POST and OPTIONS")
{
    HandlerProbe probe;
    const auto response = make_http_response(make_request(http::verb::get, "/", ""), probe.handler());

    CHECK(response.result() == http::status::method_not_allowed);
    CHECK(response[http::field::allow] == "POST, OPTIONS");
    CHECK(probe.calls == 0);
}

TEST_CASE("make_http_response turns handler exceptions into 500")
{
    const BodyHandler failing = [](std::string_view) -> std::optional<std::string> {
        throw std::runtime_error("dispatcher unavailable");
    };
    const auto response =
        make_http_response(make_request(http::verb::post, "/", "application/json", "{}"), failing);

    CHECK(response.result() == http::status::internal_server_error);
    CHECK_FALSE(response.keep_alive());
}

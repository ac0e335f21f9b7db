#pragma once

#include "rowpager/server/http_exchange.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rowpager::server {

struct TlsConfig final {
    std::filesystem::path certificate_chain{};
    std::filesystem::path private_key{};
    std::string key_password{};
};

// Builds a TlsConfig from the three -s values in order: certificate chain,
// private key, key password. Throws std::invalid_argument on any other count.
[[nodiscard]] TlsConfig tls_config_from_arguments(const std::vector<std::string>& values);

struct ServerConfig final {
    std::string address = "localhost";
    std::uint16_t port = 1995U;
    std::size_t body_limit = 8U * 1024U * 1024U;
    std::chrono::seconds idle_timeout{30};
    std::optional<TlsConfig> tls{};
};

class Listener;

// Serves JSON-RPC over HTTP(S) on the caller's io_context. The caller runs
// the io_context; run() returns once stop() has drained every connection.
class HttpServer final {
public:
    HttpServer(boost::asio::io_context& io, ServerConfig config, BodyHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    // Binds and starts accepting. Throws on resolve, bind or TLS setup
    // failures.
    void start();

    // Safe to call from any thread. Closes the acceptor, lets in-flight
    // responses finish and then closes their connections.
    void stop();

    [[nodiscard]] std::uint16_t local_port() const noexcept;
    [[nodiscard]] bool tls_enabled() const noexcept;

private:
    std::shared_ptr<Listener> listener_;
};

}  // namespace rowpager::server

#include "rowpager/server/http_server.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rowpager::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

class HttpConnectionBase {
public:
    virtual ~HttpConnectionBase() = default;
    virtual void stop() = 0;
};

class Listener final : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& io, ServerConfig config, BodyHandler handler)
        : io_{io}
        , config_{std::move(config)}
        , handler_{std::move(handler)}
        , acceptor_{io}
    {
    }

    void start();
    void stop();

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const BodyHandler& handler() const noexcept { return handler_; }
    [[nodiscard]] bool stopping() const noexcept { return stopping_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_.load(std::memory_order_acquire); }
    [[nodiscard]] bool tls_enabled() const noexcept { return config_.tls.has_value(); }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void do_stop();
    void track(const std::shared_ptr<HttpConnectionBase>& connection);

    net::io_context& io_;
    ServerConfig config_;
    BodyHandler handler_;
    tcp::acceptor acceptor_;
    std::optional<ssl::context> tls_context_{};
    std::vector<std::weak_ptr<HttpConnectionBase>> connections_{};
    bool stopping_ = false;
    std::atomic<std::uint16_t> port_{0U};
};

namespace {

template <class Derived>
class HttpConnection : public HttpConnectionBase {
public:
    explicit HttpConnection(std::shared_ptr<Listener> listener)
        : listener_{std::move(listener)}
    {
    }

    void stop() override
    {
        // Idle connections are closed now; busy ones close after their write.
        if (reading_) {
            beast::get_lowest_layer(derived().stream()).close();
        }
    }

protected:
    Derived& derived()
    {
        return static_cast<Derived&>(*this);
    }

    void do_read()
    {
        if (listener_->stopping()) {
            derived().do_eof();
            return;
        }

        parser_.emplace();
        parser_->body_limit(listener_->config().body_limit);
        beast::get_lowest_layer(derived().stream()).expires_after(listener_->config().idle_timeout);

        reading_ = true;
        http::async_read(derived().stream(),
                         buffer_,
                         *parser_,
                         beast::bind_front_handler(&HttpConnection::on_read, derived().shared_from_this()));
    }

    std::shared_ptr<Listener> listener_;

private:
    void on_read(beast::error_code ec, std::size_t)
    {
        reading_ = false;
        if (ec == http::error::end_of_stream) {
            derived().do_eof();
            return;
        }

        if (ec == http::error::body_limit) {
            write(std::make_shared<HttpResponse>(
                make_status_response(http::status::payload_too_large, "Request Body Too Large", 11U, false)));
            return;
        }

        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                std::cerr << "[info] connection read failed: " << ec.message() << '\n';
            }
            return;
        }

        auto response = std::make_shared<HttpResponse>(make_http_response(parser_->get(), listener_->handler()));
        if (listener_->stopping()) {
            response->keep_alive(false);
        }
        write(std::move(response));
    }

    void write(std::shared_ptr<HttpResponse> response)
    {
        beast::get_lowest_layer(derived().stream()).expires_after(listener_->config().idle_timeout);
        auto& message = *response;
        http::async_write(derived().stream(),
                          message,
                          [self = derived().shared_from_this(), response = std::move(response)](beast::error_code ec,
                                                                                                 std::size_t) {
                              self->on_write(response->keep_alive(), ec);
                          });
    }

    void on_write(bool keep_alive, beast::error_code ec)
    {
        if (ec) {
            std::cerr << "[info] connection write failed: " << ec.message() << '\n';
            return;
        }

        if (!keep_alive || listener_->stopping()) {
            derived().do_eof();
            return;
        }

        do_read();
    }

    beast::flat_buffer buffer_{};
    std::optional<http::request_parser<http::string_body>> parser_{};
    bool reading_ = false;
};

class PlainHttpConnection final : public HttpConnection<PlainHttpConnection>,
                                  public std::enable_shared_from_this<PlainHttpConnection> {
public:
    PlainHttpConnection(std::shared_ptr<Listener> listener, tcp::socket&& socket)
        : HttpConnection<PlainHttpConnection>{std::move(listener)}
        , stream_{std::move(socket)}
    {
    }

    void run()
    {
        do_read();
    }

    beast::tcp_stream& stream() noexcept
    {
        return stream_;
    }

    void do_eof()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != beast::errc::not_connected) {
            std::cerr << "[info] connection shutdown failed: " << ec.message() << '\n';
        }
    }

private:
    beast::tcp_stream stream_;
};

class SslHttpConnection final : public HttpConnection<SslHttpConnection>,
                                public std::enable_shared_from_this<SslHttpConnection> {
public:
    SslHttpConnection(std::shared_ptr<Listener> listener, tcp::socket&& socket, ssl::context& context)
        : HttpConnection<SslHttpConnection>{std::move(listener)}
        , stream_{std::move(socket), context}
    {
    }

    void run()
    {
        beast::get_lowest_layer(stream_).expires_after(listener_->config().idle_timeout);
        stream_.async_handshake(ssl::stream_base::server,
                                beast::bind_front_handler(&SslHttpConnection::on_handshake, shared_from_this()));
    }

    beast::ssl_stream<beast::tcp_stream>& stream() noexcept
    {
        return stream_;
    }

    void do_eof()
    {
        beast::get_lowest_layer(stream_).expires_after(listener_->config().idle_timeout);
        stream_.async_shutdown(beast::bind_front_handler(&SslHttpConnection::on_shutdown, shared_from_this()));
    }

private:
    void on_handshake(beast::error_code ec)
    {
        if (ec) {
            std::cerr << "[info] TLS handshake failed: " << ec.message() << '\n';
            return;
        }
        do_read();
    }

    void on_shutdown(beast::error_code ec)
    {
        if (ec && ec != net::ssl::error::stream_truncated) {
            std::cerr << "[info] TLS shutdown failed: " << ec.message() << '\n';
        }
    }

    beast::ssl_stream<beast::tcp_stream> stream_;
};

[[nodiscard]] ssl::context make_tls_context(const TlsConfig& tls)
{
    ssl::context context{ssl::context::tls_server};
    context.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                        ssl::context::single_dh_use);
    context.set_password_callback([password = tls.key_password](std::size_t, ssl::context::password_purpose) {
        return password;
    });
    context.use_certificate_chain_file(tls.certificate_chain.string());
    context.use_private_key_file(tls.private_key.string(), ssl::context::pem);
    return context;
}

}  // namespace

void Listener::start()
{
    if (config_.tls) {
        tls_context_.emplace(make_tls_context(*config_.tls));
    }

    tcp::resolver resolver{io_};
    const auto results = resolver.resolve(config_.address, std::to_string(config_.port), tcp::resolver::passive);
    if (results.empty()) {
        throw std::runtime_error("no address found for '" + config_.address + "'");
    }
    const tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    port_.store(acceptor_.local_endpoint().port(), std::memory_order_release);

    do_accept();
}

void Listener::do_accept()
{
    acceptor_.async_accept([self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        self->on_accept(ec, std::move(socket));
    });
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket)
{
    if (stopping_ || ec == net::error::operation_aborted) {
        return;
    }

    if (ec) {
        std::cerr << "[info] accept failed: " << ec.message() << '\n';
    } else if (tls_context_) {
        auto connection = std::make_shared<SslHttpConnection>(shared_from_this(), std::move(socket), *tls_context_);
        track(connection);
        connection->run();
    } else {
        auto connection = std::make_shared<PlainHttpConnection>(shared_from_this(), std::move(socket));
        track(connection);
        connection->run();
    }

    do_accept();
}

void Listener::track(const std::shared_ptr<HttpConnectionBase>& connection)
{
    connections_.erase(std::remove_if(connections_.begin(),
                                      connections_.end(),
                                      [](const std::weak_ptr<HttpConnectionBase>& entry) { return entry.expired(); }),
                       connections_.end());
    connections_.push_back(connection);
}

void Listener::stop()
{
    net::post(io_, [self = shared_from_this()] { self->do_stop(); });
}

void Listener::do_stop()
{
    if (stopping_) {
        return;
    }
    stopping_ = true;

    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        std::cerr << "[info] acceptor close failed: " << ec.message() << '\n';
    }

    for (const auto& entry : connections_) {
        if (auto connection = entry.lock()) {
            connection->stop();
        }
    }
    connections_.clear();
}

TlsConfig tls_config_from_arguments(const std::vector<std::string>& values)
{
    if (values.size() != 3U) {
        throw std::invalid_argument("TLS needs a certificate chain, a private key and a key password");
    }
    return TlsConfig{
        .certificate_chain = values[0],
        .private_key = values[1],
        .key_password = values[2],
    };
}

HttpServer::HttpServer(net::io_context& io, ServerConfig config, BodyHandler handler)
    : listener_{std::make_shared<Listener>(io, std::move(config), std::move(handler))}
{
}

HttpServer::~HttpServer() = default;

void HttpServer::start()
{
    listener_->start();
}

void HttpServer::stop()
{
    listener_->stop();
}

std::uint16_t HttpServer::local_port() const noexcept
{
    return listener_->port();
}

bool HttpServer::tls_enabled() const noexcept
{
    return listener_->tls_enabled();
}

}  // namespace rowpager::server

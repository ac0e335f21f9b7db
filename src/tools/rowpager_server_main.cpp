#include "rowpager/driver/sqlite_driver.hpp"
#include "rowpager/rpc/method_registry.hpp"
#include "rowpager/rpc/rpc_dispatcher.hpp"
#include "rowpager/rpc/session_methods.hpp"
#include "rowpager/server/http_server.hpp"
#include "rowpager/server/shutdown_watcher.hpp"
#include "rowpager/session/session.hpp"
#include "rowpager/session/shutdown_signal.hpp"
#include "rowpager/tools/call_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

void print_telemetry_summary(const rowpager::rpc::RpcTelemetrySnapshot& snapshot)
{
    std::cerr << "[info] rpc summary:";
    for (const auto& [method, entry] : snapshot.methods) {
        std::cerr << ' ' << method << '=' << entry.successes << '/' << entry.attempts;
    }
    std::cerr << " parse_errors=" << snapshot.failures.parse_errors
              << " invalid_requests=" << snapshot.failures.invalid_requests
              << " method_not_found=" << snapshot.failures.method_not_found
              << " invalid_params=" << snapshot.failures.invalid_params
              << " internal_errors=" << snapshot.failures.internal_errors
              << " suppressed=" << snapshot.suppressed_responses << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"JSON-RPC paging server for a relational database."};

    bool quiet = false;
    std::uint16_t port = 1995U;
    std::string connection_string;
    std::vector<std::string> ssl_arguments;
    std::string bind_address = "localhost";
    std::size_t max_body_bytes = 8U * 1024U * 1024U;
    std::string log_json_path;

    app.add_option("-p,--port", port, "Port to listen on")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();
    app.add_option("-c,--connection", connection_string, "Database connection string (SQLite filename or file: URI)")
        ->required();
    app.add_option("-s,--ssl", ssl_arguments, "Serve HTTPS using a certificate chain, its private key and the key password, in that order")
        ->type_name("CERT KEY PASSWORD")
        ->expected(3);
    app.add_option("--bind", bind_address, "Address to bind")
        ->capture_default_str();
    app.add_option("--max-body-bytes", max_body_bytes, "Largest accepted request body")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--log-json", log_json_path, "Write structured call logs as JSON Lines (use '-' for stdout)");
    app.add_flag("-q,--quiet", quiet, "Suppress startup banner and exit summary");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    std::unique_ptr<rowpager::driver::Connection> connection;
    try {
        connection = std::make_unique<rowpager::driver::SqliteConnection>(connection_string);
    } catch (const std::exception& error) {
        std::cerr << "error: failed to open connection: " << error.what() << '\n';
        return 1;
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;
    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    rowpager::session::ShutdownSignal shutdown;
    rowpager::session::Session session{std::move(connection), shutdown};

    rowpager::rpc::MethodRegistry registry;
    rowpager::rpc::register_session_methods(registry, session);

    rowpager::rpc::RpcDispatcher::Config dispatcher_config{};
    dispatcher_config.registry = &registry;
    if (log_stream != nullptr) {
        dispatcher_config.call_logger = [log_stream, &log_mutex](const rowpager::rpc::CallMetrics& metrics) {
            const auto line = rowpager::tools::format_call_log_json(metrics);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }
    rowpager::rpc::RpcDispatcher dispatcher{std::move(dispatcher_config)};

    rowpager::server::ServerConfig server_config{};
    server_config.address = bind_address;
    server_config.port = port;
    server_config.body_limit = max_body_bytes;
    if (!ssl_arguments.empty()) {
        server_config.tls = rowpager::server::tls_config_from_arguments(ssl_arguments);
    }

    boost::asio::io_context io;
    rowpager::server::HttpServer server{io, server_config, [&dispatcher](std::string_view body) {
                                            return dispatcher.handle_body(body);
                                        }};

    try {
        server.start();
    } catch (const std::exception& error) {
        std::cerr << "error: failed to start server: " << error.what() << '\n';
        return 1;
    }

    boost::asio::signal_set signals{io, SIGINT, SIGTERM};
    signals.async_wait([&shutdown](const boost::system::error_code& ec, int) {
        if (!ec) {
            shutdown.request();
        }
    });

    auto cancel_signals = [&signals, &io] {
        boost::asio::post(io, [&signals] {
            boost::system::error_code ec;
            signals.cancel(ec);
            if (ec) {
                std::cerr << "[info] signal cancel failed: " << ec.message() << '\n';
            }
        });
    };
    rowpager::server::ShutdownWatcher watcher{shutdown, server, std::move(cancel_signals)};
    watcher.start();

    if (!quiet) {
        std::cerr << "[info] listening on " << (server.tls_enabled() ? "https://" : "http://") << bind_address << ':'
                  << server.local_port() << '/' << '\n';
    }

    int exit_code = 0;
    try {
        io.run();
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        exit_code = 1;
    }

    watcher.stop();

    if (!quiet) {
        std::cerr << "[info] session " << rowpager::session::session_state_to_string(session.state()) << '\n';
        print_telemetry_summary(dispatcher.telemetry().snapshot());
    }
    return exit_code;
}

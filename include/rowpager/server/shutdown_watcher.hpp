#pragma once

#include "rowpager/server/http_server.hpp"
#include "rowpager/session/shutdown_signal.hpp"

#include <functional>
#include <mutex>
#include <thread>

namespace rowpager::server {

// Waits on the shutdown signal from its own thread and stops the server once
// it is raised, so a quit handled inside a request never blocks the loop it
// runs on. The hook runs on the watcher thread after stop() was issued.
class ShutdownWatcher final {
public:
    using Hook = std::function<void()>;

    ShutdownWatcher(session::ShutdownSignal& signal, HttpServer& server, Hook on_shutdown = {});
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;
    ShutdownWatcher(ShutdownWatcher&&) = delete;
    ShutdownWatcher& operator=(ShutdownWatcher&&) = delete;

    void start();

    // Raises the signal if nobody has yet and joins the watcher thread.
    void stop();

    [[nodiscard]] bool running() const;

private:
    void watch();

    session::ShutdownSignal& signal_;
    HttpServer& server_;
    Hook on_shutdown_{};
    std::thread thread_{};
    mutable std::mutex mutex_{};
    bool running_ = false;
};

}  // namespace rowpager::server

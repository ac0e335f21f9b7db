#include "rowpager/server/shutdown_watcher.hpp"

#include <utility>

namespace rowpager::server {

ShutdownWatcher::ShutdownWatcher(session::ShutdownSignal& signal, HttpServer& server, Hook on_shutdown)
    : signal_{signal}
    , server_{server}
    , on_shutdown_{std::move(on_shutdown)}
{
}

ShutdownWatcher::~ShutdownWatcher()
{
    stop();
}

void ShutdownWatcher::start()
{
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }

    running_ = true;
    thread_ = std::thread([this]() { watch(); });
}

void ShutdownWatcher::stop()
{
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
    }

    signal_.request();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard lock(mutex_);
    running_ = false;
}

bool ShutdownWatcher::running() const
{
    std::lock_guard lock(mutex_);
    return running_;
}

void ShutdownWatcher::watch()
{
    signal_.wait();
    server_.stop();
    if (on_shutdown_) {
        on_shutdown_();
    }
}

}  // namespace rowpager::server

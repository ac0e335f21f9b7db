#include "rowpager/session/shutdown_signal.hpp"

namespace rowpager::session {

void ShutdownSignal::request()
{
    {
        std::lock_guard guard(mutex_);
        if (requested_) {
            return;
        }
        requested_ = true;
    }
    cv_.notify_all();
}

void ShutdownSignal::wait() const
{
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return requested_; });
}

bool ShutdownSignal::requested() const
{
    std::lock_guard guard(mutex_);
    return requested_;
}

}  // namespace rowpager::session

#pragma once

#include <condition_variable>
#include <mutex>

namespace rowpager::session {

// One-shot stop channel shared between the session and whoever owns the
// serving loop. request() never blocks, so it is safe to raise from inside a
// request handler; the owner waits on it from its own thread.
class ShutdownSignal final {
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;
    ShutdownSignal(ShutdownSignal&&) = delete;
    ShutdownSignal& operator=(ShutdownSignal&&) = delete;

    void request();
    void wait() const;
    [[nodiscard]] bool requested() const;

private:
    mutable std::mutex mutex_{};
    mutable std::condition_variable cv_{};
    bool requested_ = false;
};

}  // namespace rowpager::session

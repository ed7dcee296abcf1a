#pragma once

#include <chrono>
#include <future>
#include <string>

namespace voxturn {

// Handle on a device-action side effect running in the background.
class PendingAction {
public:
    PendingAction() = default;
    PendingAction(std::string name, std::shared_future<void> done)
        : name_(std::move(name)), done_(std::move(done)) {}

    const std::string& name() const { return name_; }
    bool valid() const { return done_.valid(); }

    void wait() const {
        if (done_.valid()) done_.wait();
    }

    bool waitFor(std::chrono::milliseconds timeout) const {
        if (!done_.valid()) return true;
        return done_.wait_for(timeout) == std::future_status::ready;
    }

    // Rethrows whatever the handler threw.
    void get() const {
        if (done_.valid()) done_.get();
    }

private:
    std::string name_;
    std::shared_future<void> done_;
};

} // namespace voxturn

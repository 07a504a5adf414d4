#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace burst {

// ---------------------------------------------------------------------------
// One named OS thread running a single body. finished() flips once the body
// returns, so the owner can poll for completion without joining.
// The body must not throw; StressSession wraps every body it starts.
// ---------------------------------------------------------------------------
class ThreadModel {
public:
    using ThreadFn = std::function<void()>;

    ThreadModel(std::string name, ThreadFn fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    ~ThreadModel() { join(); }

    ThreadModel(const ThreadModel&) = delete;
    ThreadModel& operator=(const ThreadModel&) = delete;

    void start() {
        if (thread_.joinable()) return;
        running_.store(true);
        thread_ = std::thread([this]() {
            fn_();
            running_.store(false);
            finished_.store(true);
        });
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    bool running() const { return running_.load(); }
    bool finished() const { return finished_.load(); }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    ThreadFn fn_;
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

}

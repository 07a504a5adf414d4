#pragma once
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "workload/Workload.hpp"

namespace burst {
namespace test {

// Shared, thread-safe record of which workload ran, in order.
class CallLog {
public:
    void add(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_);
        calls_.push_back(name);
    }
    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(m_);
        return calls_;
    }

private:
    mutable std::mutex m_;
    std::vector<std::string> calls_;
};

// Workload whose behaviour is scripted per call number (1-based).
class ScriptedWorkload : public Workload {
public:
    explicit ScriptedWorkload(std::string name, CallLog* log = nullptr)
        : name_(std::move(name)), log_(log) {}

    const char* name() const override { return name_.c_str(); }

    void run() override {
        ++runs_;
        if (log_) log_->add(name_);
        if (on_run) on_run(runs_);
        if (throw_on_run_ == runs_) throw std::runtime_error("scripted run failure");
    }

    std::optional<std::string> validate() override {
        ++validations_;
        if (fail_on_validate_ == validations_) return fail_message_;
        return std::nullopt;
    }

    ScriptedWorkload& fail_on_validate(int n, std::string msg = "scripted validation failure") {
        fail_on_validate_ = n;
        fail_message_ = std::move(msg);
        return *this;
    }
    ScriptedWorkload& throw_on_run(int n) {
        throw_on_run_ = n;
        return *this;
    }

    int runs() const { return runs_; }
    int validations() const { return validations_; }

    std::function<void(int)> on_run;

private:
    std::string name_;
    CallLog*    log_;
    int runs_{0};
    int validations_{0};
    int fail_on_validate_{0};
    int throw_on_run_{0};
    std::string fail_message_;
};

inline bool bind_ok(int) { return true; }
inline bool bind_fail(int) { return false; }

}
}

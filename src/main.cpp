#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include "config/RunConfig.hpp"
#include "runtime/Context.hpp"
#include "runtime/CpuPinning.hpp"
#include "runtime/StressSession.hpp"
#include "telemetry/TelemetrySource.hpp"
#include "workload/WorkloadRegistry.hpp"

using namespace burst;

// ---------------------------------------------------------------------------
// Signal handler only sets the flag. Stop, join and the summary all happen on
// the main thread after the wait loop exits.
// ---------------------------------------------------------------------------
static std::atomic<bool> g_stop_flag{false};

void handle_stop_signal(int) {
    g_stop_flag.store(true, std::memory_order_relaxed);
}

static void print_banner() {
    std::cout << "=== Brutal Utilization & Resilience Stress Testing ===\n"
              << "    || ============= B.U.R.S.T. =============== ||\n"
              << "    ||     === CPU Stress Test Utility ===      ||\n\n";
}

// true once the operator pressed Enter (or stdin delivered anything).
// EOF disables stdin watching; the run then ends on a signal or completion.
static bool operator_pressed_enter(bool& stdin_open, int timeout_ms) {
    if (!stdin_open) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return false;
    }
    if (std::cin.rdbuf()->in_avail() > 0) return true;

    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc <= 0) return false;   // timeout or EINTR from a signal

    char buf[256];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
        stdin_open = false;
        return false;
    }
    return true;
}

static void print_summary(Context& ctx) {
    // Anything the monitor did not get to (e.g. it failed at startup).
    for (const auto& e : ctx.run.errors.drain())
        std::cerr << "[BURST] ERROR " << e.source << ": " << e.message << "\n";

    std::cout << "\n[BURST] ===== SUMMARY =====\n";
    for (const auto& kv : ctx.run.progress.snapshot()) {
        for (const auto& p : kv.second) {
            const bool failed = ctx.errors.has_failures(p.core, p.workload);
            const char* state = failed ? "FAILED"
                              : (p.completed == p.total ? "done" : "incomplete");
            std::cout << "[BURST] core " << p.core << " " << p.workload << ": "
                      << p.completed << "/" << p.total << " " << state << "\n";
        }
    }

    ErrorSummary s = ctx.errors.summary(5);
    std::cout << "[BURST] Errors: " << s.total << "\n";
    for (const auto& o : s.top) {
        std::cout << "[BURST]   " << o.key.to_string()
                  << " consecutive=" << o.counters.consecutive
                  << " total=" << o.counters.total
                  << " last: " << o.counters.last_message << "\n";
    }
}

int main(int argc, char** argv) {
    print_banner();

    // .env before anything reads the environment; ./ then ../ (run from build/)
    load_dotenv(".env");
    load_dotenv("../.env");

    WorkloadRegistry registry = WorkloadRegistry::with_builtins();
    const int max_cores = CpuPinning::logical_cores();

    RunConfig cfg;
    try {
        cfg = parse_args(argc, argv, registry, max_cores);
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 1;
    }

    if (cfg.help) {
        print_usage(std::cout);
        return 0;
    }
    if (cfg.list_tests) {
        print_catalog(registry, std::cout);
        return 0;
    }

    apply_env_overrides(cfg);

    try {
        if (cfg.needs_prompt())
            prompt_missing(cfg, registry, max_cores, std::cin, std::cout);
        validate(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        return 1;
    }

    LinuxTelemetry telemetry;
    std::cout << "[BURST] CPU: " << telemetry.device_name() << "\n";
    std::cout << "[BURST] Logical cores: " << max_cores << ", selected: " << cfg.cores.size()
              << ", workloads: " << cfg.tests.size() << ", mode: " << to_string(cfg.policy) << "\n";
    std::cout << "[BURST] Snapshot log: " << cfg.log_path << "\n";

    // ---- CONTEXT: single owner of all shared run state ----
    Context ctx;

    std::signal(SIGINT,  handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    StressSession session(ctx, registry, telemetry, cfg);
    session.start();

    std::cout << "[BURST] Running. Press Enter to stop.\n";

    bool stdin_open = true;
    while (!g_stop_flag.load(std::memory_order_relaxed) && !session.all_workers_done()) {
        if (operator_pressed_enter(stdin_open, 200)) {
            std::cout << "[BURST] Stop requested\n";
            break;
        }
    }
    if (g_stop_flag.load()) std::cout << "[BURST] Signal received, stopping\n";
    if (session.all_workers_done()) std::cout << "[BURST] All workers finished\n";

    session.request_stop();
    session.join();

    print_summary(ctx);
    return ctx.errors.any_error_seen() ? 2 : 0;
}

#pragma once
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include "engine/SchedulingEngine.hpp"
#include "monitor/MonitorLoop.hpp"
#include "workload/WorkloadRegistry.hpp"

namespace burst {

// Bad command line or environment. main() prints it with [CONFIG] and exits 1.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Everything a run needs. Filled from argv, then environment, then the
// interactive prompts for whatever is still missing.
// ---------------------------------------------------------------------------
struct RunConfig {
    std::vector<int> cores;
    std::vector<int> tests;
    std::vector<int> cycles;
    SchedulePolicy   policy{SchedulePolicy::Sequential};
    bool             policy_given{false};

    std::string log_path{"log.json"};
    int  interval_ms{1000};
    int  warmup_ms{800};
    int  ready_timeout_ms{3000};
    int  monitor_core{-1};

    bool help{false};
    bool list_tests{false};

    // flags seen on the command line; environment only fills the others
    bool log_given{false};
    bool interval_given{false};
    bool ready_timeout_given{false};

    bool needs_prompt() const;
    MonitorOptions monitor_options() const;
};

// all | even | odd | N | A-B, comma/space separated and combinable.
// Result is inside [0, max_cores), de-duplicated and sorted.
std::vector<int> parse_core_list(const std::string& text, int max_cores);

// Non-negative integers; invalid or negative tokens are dropped.
std::vector<int> parse_cycles(const std::string& text);

// seq|sequential|1, round|rr|2, rand|random|3 (case-insensitive).
// Anything else falls back to Sequential.
SchedulePolicy parse_mode(const std::string& text);

// --flag value style plus the legacy positional "<cores> <tests>".
// Throws ConfigError on an unknown flag, a missing value or a bad number.
RunConfig parse_args(int argc, const char* const* argv, const WorkloadRegistry& registry,
                     int max_cores);

// KEY=VALUE lines into the process environment; existing variables win.
// Returns false when the file does not exist.
bool load_dotenv(const std::string& path);

// BURST_LOG, BURST_INTERVAL_MS, BURST_READY_TIMEOUT_MS for flags not given.
void apply_env_overrides(RunConfig& cfg);

// Asks for cores, tests, cycles and mode when absent, repeating until the
// answer parses. Throws ConfigError if input ends first.
void prompt_missing(RunConfig& cfg, const WorkloadRegistry& registry, int max_cores,
                    std::istream& in, std::ostream& out);

// Throws ConfigError describing the first problem found.
void validate(const RunConfig& cfg);

void print_usage(std::ostream& out);
void print_catalog(const WorkloadRegistry& registry, std::ostream& out);

}

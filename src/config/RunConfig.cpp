#include "config/RunConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>

using namespace burst;

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> out;
    std::string tok;
    for (char ch : s) {
        if (ch == ',' || ch == ' ' || ch == '\t') {
            if (!tok.empty()) out.push_back(tok);
            tok.clear();
        } else {
            tok.push_back(ch);
        }
    }
    if (!tok.empty()) out.push_back(tok);
    return out;
}

bool to_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

int int_flag(const std::string& flag, const std::string& value) {
    int v = 0;
    if (!to_int(value, v))
        throw ConfigError(flag + " expects an integer, got '" + value + "'");
    return v;
}

}

// ---- RunConfig ----

bool RunConfig::needs_prompt() const {
    return cores.empty() || tests.empty() || cycles.size() != tests.size() || !policy_given;
}

MonitorOptions RunConfig::monitor_options() const {
    MonitorOptions o;
    o.interval     = std::chrono::milliseconds(interval_ms);
    o.warmup       = std::chrono::milliseconds(warmup_ms);
    o.monitor_core = monitor_core;
    o.log_path     = log_path;
    return o;
}

// ---- value parsers ----

std::vector<int> burst::parse_core_list(const std::string& text, int max_cores) {
    std::set<int> picked;
    auto add = [&](int c) { if (c >= 0 && c < max_cores) picked.insert(c); };

    for (const auto& raw : split(lower(trim(text)))) {
        if (raw == "all") {
            for (int i = 0; i < max_cores; ++i) add(i);
        } else if (raw == "even") {
            for (int i = 0; i < max_cores; i += 2) add(i);
        } else if (raw == "odd") {
            for (int i = 1; i < max_cores; i += 2) add(i);
        } else if (raw.find('-', 1) != std::string::npos) {
            size_t dash = raw.find('-', 1);
            int a = 0, b = 0;
            if (!to_int(raw.substr(0, dash), a) || !to_int(raw.substr(dash + 1), b)) {
                std::cerr << "[CONFIG] Cannot parse core range '" << raw << "', skipping\n";
                continue;
            }
            if (a > b) std::swap(a, b);
            for (int i = std::max(a, 0); i <= b && i < max_cores; ++i) add(i);
        } else {
            int c = 0;
            if (!to_int(raw, c)) {
                std::cerr << "[CONFIG] Cannot parse core '" << raw << "', skipping\n";
                continue;
            }
            add(c);
        }
    }
    return std::vector<int>(picked.begin(), picked.end());
}

std::vector<int> burst::parse_cycles(const std::string& text) {
    std::vector<int> out;
    for (const auto& tok : split(text)) {
        int v = 0;
        if (to_int(tok, v) && v >= 0) out.push_back(v);
        else std::cerr << "[CONFIG] Ignoring cycle count '" << tok << "'\n";
    }
    return out;
}

SchedulePolicy burst::parse_mode(const std::string& text) {
    const std::string m = lower(trim(text));
    if (m == "seq" || m == "sequential" || m == "1")  return SchedulePolicy::Sequential;
    if (m == "round" || m == "rr" || m == "2")        return SchedulePolicy::RoundRobin;
    if (m == "rand" || m == "random" || m == "3")     return SchedulePolicy::Random;
    if (!m.empty())
        std::cerr << "[CONFIG] Unknown mode '" << text << "', using sequential\n";
    return SchedulePolicy::Sequential;
}

// ---- argv ----

RunConfig burst::parse_args(int argc, const char* const* argv, const WorkloadRegistry& registry,
                            int max_cores) {
    RunConfig cfg;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") { cfg.help = true; continue; }
        if (arg == "--list-tests")          { cfg.list_tests = true; continue; }

        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }

        std::string value;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg   = arg.substr(0, eq);
        } else {
            if (i + 1 >= argc)
                throw ConfigError(arg + " requires a value");
            value = argv[++i];
        }

        if (arg == "--cores") {
            cfg.cores = parse_core_list(value, max_cores);
        } else if (arg == "--tests") {
            cfg.tests = registry.parse_selection(value);
        } else if (arg == "--cycles") {
            cfg.cycles = parse_cycles(value);
        } else if (arg == "--mode") {
            cfg.policy = parse_mode(value);
            cfg.policy_given = true;
        } else if (arg == "--log") {
            if (value.empty()) throw ConfigError("--log requires a path");
            cfg.log_path  = value;
            cfg.log_given = true;
        } else if (arg == "--interval-ms") {
            cfg.interval_ms    = int_flag(arg, value);
            cfg.interval_given = true;
        } else if (arg == "--warmup-ms") {
            cfg.warmup_ms = int_flag(arg, value);
        } else if (arg == "--ready-timeout-ms") {
            cfg.ready_timeout_ms    = int_flag(arg, value);
            cfg.ready_timeout_given = true;
        } else if (arg == "--monitor-core") {
            cfg.monitor_core = int_flag(arg, value);
        } else {
            throw ConfigError("unknown option " + arg);
        }
    }

    // legacy form: burst <cores> <tests>
    if (positional.size() > 2)
        throw ConfigError("unexpected argument '" + positional[2] + "'");
    if (!positional.empty() && cfg.cores.empty())
        cfg.cores = parse_core_list(positional[0], max_cores);
    if (positional.size() > 1 && cfg.tests.empty())
        cfg.tests = registry.parse_selection(positional[1]);

    return cfg;
}

// ---- environment ----

bool burst::load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.rfind("export ", 0) == 0) key = trim(key.substr(7));
        if (key.empty()) continue;

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q)
                value = value.substr(1, value.size() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0);
    }

    std::cout << "[CONFIG] .env loaded from " << path << "\n";
    return true;
}

void burst::apply_env_overrides(RunConfig& cfg) {
    auto env_int = [](const char* name, int& target) {
        const char* v = std::getenv(name);
        if (!v) return;
        int parsed = 0;
        if (to_int(trim(v), parsed)) target = parsed;
        else std::cerr << "[CONFIG] Ignoring " << name << "='" << v << "' (not an integer)\n";
    };

    if (!cfg.log_given) {
        const char* v = std::getenv("BURST_LOG");
        if (v && *v) cfg.log_path = v;
    }
    if (!cfg.interval_given)      env_int("BURST_INTERVAL_MS", cfg.interval_ms);
    if (!cfg.ready_timeout_given) env_int("BURST_READY_TIMEOUT_MS", cfg.ready_timeout_ms);
}

// ---- interactive ----

namespace {

std::string ask(std::istream& in, std::ostream& out, const std::string& prompt) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line))
        throw ConfigError("input closed while waiting for an answer");
    return line;
}

}

void burst::prompt_missing(RunConfig& cfg, const WorkloadRegistry& registry, int max_cores,
                           std::istream& in, std::ostream& out) {
    if (cfg.cores.empty()) {
        out << "Logical cores, comma separated (e.g. 0,1,2,4),\n";
        std::string prompt = "or 'all' / 'even' / 'odd' / a range like 0-7: ";
        while (true) {
            cfg.cores = parse_core_list(ask(in, out, prompt), max_cores);
            if (!cfg.cores.empty()) break;
            prompt = "No usable cores recognized. Try again: ";
        }
    }

    if (cfg.tests.empty()) {
        out << "\nWorkload ids, comma separated (e.g. 1,2,7). Available:\n";
        print_catalog(registry, out);
        std::string prompt = "Workloads: ";
        while (true) {
            cfg.tests = registry.parse_selection(ask(in, out, prompt));
            if (!cfg.tests.empty()) break;
            prompt = "No known workloads recognized. Try again: ";
        }
    }

    if (cfg.cycles.size() != cfg.tests.size()) {
        out << "\nCycle count for each workload, comma separated,\n"
            << "e.g. for 4 workloads: 100,100,100,100\n";
        std::string prompt = "Cycles: ";
        while (true) {
            cfg.cycles = parse_cycles(ask(in, out, prompt));
            if (cfg.cycles.size() == cfg.tests.size()) break;
            prompt = "Expected " + std::to_string(cfg.tests.size()) +
                     " integers >= 0. Try again: ";
        }
    }

    if (!cfg.policy_given) {
        out << "\nScheduling mode:\n"
            << "  seq   - each workload runs all its cycles, then the next\n"
            << "  round - one cycle of every workload per round\n"
            << "  rand  - one cycle of a random workload until none are left\n";
        std::string answer = trim(ask(in, out, "Mode [default: seq]: "));
        if (!answer.empty()) cfg.policy = parse_mode(answer);
        cfg.policy_given = true;
    }
}

void burst::validate(const RunConfig& cfg) {
    if (cfg.cores.empty())
        throw ConfigError("no valid cores selected");
    if (cfg.tests.empty())
        throw ConfigError("no valid workloads selected");
    if (cfg.cycles.size() != cfg.tests.size())
        throw ConfigError("got " + std::to_string(cfg.cycles.size()) + " cycle counts for " +
                          std::to_string(cfg.tests.size()) + " workloads");
    for (int c : cfg.cycles)
        if (c < 0) throw ConfigError("cycle counts must be >= 0");
    if (cfg.interval_ms <= 0)
        throw ConfigError("--interval-ms must be > 0");
    if (cfg.warmup_ms < 0)
        throw ConfigError("--warmup-ms must be >= 0");
    if (cfg.ready_timeout_ms < 0)
        throw ConfigError("--ready-timeout-ms must be >= 0");
    if (cfg.log_path.empty())
        throw ConfigError("log path is empty");
}

void burst::print_usage(std::ostream& out) {
    out << "Usage:\n"
        << "  burst --cores <cores> --tests <ids> --cycles <counts> --mode <seq|round|rand>\n"
        << "  burst <cores> <ids>            (cycles and mode are asked interactively)\n"
        << "\n"
        << "  <cores>   all | even | odd | list (0,1,2) | range (0-7) | mix (0-3,6,8-10)\n"
        << "  <ids>     workload ids, comma separated; see --list-tests\n"
        << "  <counts>  one count per workload, same order (0 allowed)\n"
        << "  <mode>    seq|sequential|1, round|rr|2, rand|random|3\n"
        << "\n"
        << "Options:\n"
        << "  --log <path>             snapshot log, JSON Lines (default log.json, env BURST_LOG)\n"
        << "  --interval-ms <ms>       monitor tick (default 1000, env BURST_INTERVAL_MS)\n"
        << "  --warmup-ms <ms>         monitor settle delay before ready (default 800)\n"
        << "  --ready-timeout-ms <ms>  max wait for the monitor (default 3000, env BURST_READY_TIMEOUT_MS)\n"
        << "  --monitor-core <n>       pin the monitor thread\n"
        << "  --list-tests             print the workload catalog\n"
        << "  -h, --help               this text\n"
        << "\n"
        << "Example:\n"
        << "  burst --cores 0-7 --tests 1,2,3,4 --cycles 100,100,100,100 --mode round\n";
}

void burst::print_catalog(const WorkloadRegistry& registry, std::ostream& out) {
    for (const auto& w : registry.catalog()) {
        out << (w.id < 10 ? " " : "") << w.id << " - " << w.name
            << "  (" << w.description << ")\n";
    }
}

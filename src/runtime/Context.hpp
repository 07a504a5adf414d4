#pragma once

#include "runtime/RunState.hpp"
#include "errors/ErrorAggregator.hpp"

namespace burst {

// Single authoritative owner of all shared run state.
// No globals. No statics. Constructed once in main() and handed by reference
// to every engine thread and to the monitor.
struct Context {
    RunState        run;
    ErrorAggregator errors;
};

}

#pragma once
#include <functional>

namespace burst {

// Binds the calling thread to one logical processor. Returns false on failure;
// callers treat that as a warning, never as fatal.
using BindFn = std::function<bool(int core_id)>;

class CpuPinning {
public:
    static bool pin_current_thread(int core_id);

    // Logical processors visible to this process (never less than 1).
    static int logical_cores();

    static BindFn binder() { return &CpuPinning::pin_current_thread; }
};

}

#include "runtime/CpuPinning.hpp"
#include <iostream>
#include <thread>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#include <unistd.h>
#endif

using namespace burst;

#ifdef __linux__

bool CpuPinning::pin_current_thread(int core_id) {
    if (core_id < 0 || core_id >= CPU_SETSIZE) {
        std::cerr << "[PIN] Core " << core_id << " outside cpu_set_t range\n";
        return false;
    }
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);
    int result = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
    if (result != 0) {
        std::cerr << "[PIN] Failed to pin to CPU " << core_id << ": " << result << "\n";
        return false;
    }
    return true;
}

int CpuPinning::logical_cores() {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? static_cast<int>(n) : 1;
}

#else

// No affinity primitive on this platform; threads float.
bool CpuPinning::pin_current_thread(int) { return false; }

int CpuPinning::logical_cores() {
    unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<int>(n) : 1;
}

#endif

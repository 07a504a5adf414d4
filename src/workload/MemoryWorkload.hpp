#pragma once
#include <cstdint>
#include <vector>
#include "workload/Workload.hpp"

namespace burst {

// ---------------------------------------------------------------------------
// 32 MiB working set, larger than any LLC:
//   1. position-dependent pattern fill, copy to a shadow buffer
//   2. overlapping memmove forward then restore from shadow
//   3. page-stride marker XOR (TLB pressure), applied twice = no-op
//   4. random XOR read-modify-write, replayed with the same seed = no-op
// After all of it the buffer must equal the shadow byte for byte.
// ---------------------------------------------------------------------------
class MemoryWorkload final : public Workload {
public:
    static constexpr size_t kBufferBytes = 32u * 1024u * 1024u;
    static constexpr size_t kStride      = 4096;
    static constexpr int    kRandomOps   = 2'000'000;

    const char* name() const override { return "MemoryStress"; }
    void run() override;
    std::optional<std::string> validate() override;

private:
    std::vector<uint8_t> buf_;
    std::vector<uint8_t> shadow_;
    uint32_t run_id_{0};
    uint64_t hash_after_{0};
};

}

#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "workload/Workload.hpp"

namespace burst {

// ---------------------------------------------------------------------------
// Digest chain over a 64 KiB block through OpenSSL EVP.
// Each iteration hashes (block || previous digest) with SHA-256; every 16th
// iteration the chain is also folded through SHA-512.
//
// Validation:
//   - chain result equal to the first run of this instance
//   - SHA-256("abc") known-answer check every kKnownAnswerEvery validations
// A failing EVP call throws (library error, not a hardware fault).
// ---------------------------------------------------------------------------
class HashingWorkload final : public Workload {
public:
    static constexpr size_t kBlockBytes       = 64u * 1024u;
    static constexpr int    kIterations       = 256;
    static constexpr int    kKnownAnswerEvery = 1024;

    HashingWorkload();

    const char* name() const override { return "HashingStress"; }
    void run() override;
    std::optional<std::string> validate() override;

private:
    using Digest = std::array<uint8_t, 32>;

    std::vector<uint8_t> block_;
    Digest   chain_{};
    Digest   reference_{};
    bool     has_reference_{false};
    uint64_t validations_{0};
};

}

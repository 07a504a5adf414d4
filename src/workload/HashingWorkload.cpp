#include "workload/HashingWorkload.hpp"
#include <cstring>
#include <stdexcept>
#include <openssl/evp.h>

using namespace burst;

namespace {

// SHA-256("abc"), FIPS 180-2 appendix B.1
constexpr uint8_t kAbcSha256[32] = {
    0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
    0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad,
};

unsigned int digest(const EVP_MD* md, const uint8_t* data, size_t len, unsigned char* out) {
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out, &out_len, md, nullptr) != 1)
        throw std::runtime_error(std::string("EVP_Digest failed for ") + EVP_MD_name(md));
    return out_len;
}

}

HashingWorkload::HashingWorkload() : block_(kBlockBytes + 32) {
    uint32_t x = 0x2545F491u;
    for (size_t i = 0; i < kBlockBytes; ++i) {
        x ^= x << 13; x ^= x >> 17; x ^= x << 5;
        block_[i] = static_cast<uint8_t>(x);
    }
}

void HashingWorkload::run() {
    unsigned char out[EVP_MAX_MD_SIZE];
    std::memset(block_.data() + kBlockBytes, 0, 32);

    for (int i = 0; i < kIterations; ++i) {
        digest(EVP_sha256(), block_.data(), block_.size(), out);
        std::memcpy(block_.data() + kBlockBytes, out, 32);

        if ((i & 15) == 15) {
            unsigned int n = digest(EVP_sha512(), block_.data() + kBlockBytes, 32, out);
            // fold 64 bytes back into the 32-byte tail
            for (unsigned int j = 0; j < n; ++j)
                block_[kBlockBytes + (j & 31)] ^= out[j];
        }
    }
    std::memcpy(chain_.data(), block_.data() + kBlockBytes, chain_.size());
}

std::optional<std::string> HashingWorkload::validate() {
    if (validations_++ % kKnownAnswerEvery == 0) {
        unsigned char out[EVP_MAX_MD_SIZE];
        const uint8_t abc[3] = {'a', 'b', 'c'};
        unsigned int n = digest(EVP_sha256(), abc, sizeof(abc), out);
        if (n != 32 || std::memcmp(out, kAbcSha256, 32) != 0)
            return "hashing error: SHA-256 known-answer check failed";
    }

    if (!has_reference_) {
        reference_     = chain_;
        has_reference_ = true;
        return std::nullopt;
    }
    if (chain_ != reference_)
        return "hashing error: digest chain differs from reference run";
    return std::nullopt;
}

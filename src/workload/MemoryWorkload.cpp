#include "workload/MemoryWorkload.hpp"
#include <cstring>

using namespace burst;

namespace {

void fill_pattern(std::vector<uint8_t>& data, uint32_t salt) {
    constexpr uint32_t A = 2654435761u;
    for (size_t i = 0; i < data.size(); ++i) {
        uint32_t t = (static_cast<uint32_t>(i) ^ salt) * A;
        t ^= (t >> 13) | (t << 19);
        data[i] = static_cast<uint8_t>(t ^ (t >> 8));
    }
}

void stride_xor(std::vector<uint8_t>& data, size_t stride) {
    for (size_t off = 0; off < data.size(); off += stride)
        data[off] ^= 0xA5;
}

void random_xor(std::vector<uint8_t>& data, uint64_t seed, int ops) {
    uint64_t x = seed | 1;
    const size_t mask = data.size() - 1;   // size is a power of two
    for (int i = 0; i < ops; ++i) {
        x ^= x << 13; x ^= x >> 7; x ^= x << 17;
        data[static_cast<size_t>(x) & mask] ^= static_cast<uint8_t>(x >> 56);
    }
}

// FNV-1a over 64-bit words, order sensitive
uint64_t order_hash(const std::vector<uint8_t>& data) {
    uint64_t h = 1469598103934665603ULL;
    const size_t words = data.size() / 8;
    for (size_t i = 0; i < words; ++i) {
        uint64_t w;
        std::memcpy(&w, data.data() + i * 8, sizeof(w));
        h ^= w;
        h *= 1099511628211ULL;
    }
    return h;
}

}

void MemoryWorkload::run() {
    if (buf_.size() != kBufferBytes) buf_.assign(kBufferBytes, 0);
    if (shadow_.size() != kBufferBytes) shadow_.assign(kBufferBytes, 0);

    ++run_id_;
    fill_pattern(buf_, run_id_ * 0x9E3779B9u);
    std::memcpy(shadow_.data(), buf_.data(), kBufferBytes);

    std::memmove(buf_.data() + 2048, buf_.data(), kBufferBytes - 2048);
    std::memcpy(buf_.data(), shadow_.data(), kBufferBytes);

    stride_xor(buf_, kStride);
    stride_xor(buf_, kStride);

    const uint64_t seed = 0xC0FFEEULL ^ run_id_;
    random_xor(buf_, seed, kRandomOps);
    random_xor(buf_, seed, kRandomOps);

    hash_after_ = order_hash(buf_);
}

std::optional<std::string> MemoryWorkload::validate() {
    if (buf_.size() != kBufferBytes || shadow_.size() != kBufferBytes)
        return "memory error: buffers not allocated";
    if (std::memcmp(buf_.data(), shadow_.data(), kBufferBytes) != 0)
        return "memory error: buffer differs from shadow copy";
    if (hash_after_ != order_hash(shadow_))
        return "memory error: ordered hash mismatch";
    return std::nullopt;
}

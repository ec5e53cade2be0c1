#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "hyperloglog.hh"

// Define here to avoid link errors
constexpr unsigned HyperLogLog::kPrecision;
constexpr size_t HyperLogLog::kRegisters;

namespace {
constexpr uint64_t kSeed = 0xadc83b19ULL;
}

uint64_t
MurmurHash64A(const void *key, size_t len, uint64_t seed) noexcept
{
    const uint64_t m = 0xc6a4a7935bd1e995ULL;
    const int r = 47;
    uint64_t h = seed ^ (len * m);

    auto data = static_cast<const unsigned char*>(key);
    auto end = data + (len - (len & 7));
    while (data != end) {
        uint64_t k;
        std::memcpy(&k, data, sizeof(k));
        data += sizeof(k);
        k *= m;
        k ^= k >> r;
        k *= m;
        h ^= k;
        h *= m;
    }

    switch (len & 7) {
    case 7: h ^= uint64_t(data[6]) << 48; // fallthrough
    case 6: h ^= uint64_t(data[5]) << 40; // fallthrough
    case 5: h ^= uint64_t(data[4]) << 32; // fallthrough
    case 4: h ^= uint64_t(data[3]) << 24; // fallthrough
    case 3: h ^= uint64_t(data[2]) << 16; // fallthrough
    case 2: h ^= uint64_t(data[1]) << 8;  // fallthrough
    case 1: h ^= uint64_t(data[0]);
            h *= m;
    }

    h ^= h >> r;
    h *= m;
    h ^= h >> r;
    return h;
}

HyperLogLog::HyperLogLog()
    : registers(kRegisters, 0)
{}

/**
 * Adds an element to the sketch.
 *
 * @param element The element.
 * @return True if one of the registers was updated.
 * @details The low kPrecision bits of the hash select the register, the
 *  length of the run of zeros that follows (plus one) is the rank stored in
 *  it, if larger than what is there.
 */
bool
HyperLogLog::Add(const std::string &element)
{
    auto hash = MurmurHash64A(element.data(), element.size(), kSeed);
    auto index = hash & (kRegisters - 1);
    hash >>= kPrecision;
    hash |= uint64_t(1) << (64 - kPrecision);  // Bounds the run length.

    uint8_t rank = 1;
    while ((hash & 1) == 0) {
        ++rank;
        hash >>= 1;
    }

    if (registers[index] >= rank)
        return false;
    registers[index] = rank;
    return true;
}

/**
 * Estimates the number of distinct elements added so far.
 */
uint64_t
HyperLogLog::Count() const
{
    const double m = static_cast<double>(kRegisters);
    double sum = 0;
    size_t zeros = 0;
    for (auto reg : registers) {
        sum += std::ldexp(1.0, -static_cast<int>(reg));
        if (reg == 0)
            ++zeros;
    }

    const double alpha = 0.7213 / (1 + 1.079 / m);
    double estimate = alpha * m * m / sum;

    // Small-range correction: linear counting while empty registers remain.
    if (estimate <= 2.5 * m and zeros > 0)
        estimate = m * std::log(m / static_cast<double>(zeros));
    return static_cast<uint64_t>(std::llround(estimate));
}

void
HyperLogLog::Merge(const HyperLogLog &other)
{
    for (size_t i = 0; i < kRegisters; ++i) {
        if (other.registers[i] > registers[i])
            registers[i] = other.registers[i];
    }
}

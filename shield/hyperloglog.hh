#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Count-distinct sketch with 2^14 six-bit registers (kept one per byte).
 *
 * Estimates the number of distinct elements added to it with a standard
 * error of about 0.81%, in constant memory. Elements are hashed with
 * MurmurHash64A.
 */
class HyperLogLog
{
    static constexpr unsigned kPrecision = 14;
    static constexpr size_t kRegisters = size_t(1) << kPrecision;

    std::vector<uint8_t> registers;

public:
    HyperLogLog();

    // Returns true if a register changed, i.e., the estimate may have moved.
    bool Add(const std::string &element);
    uint64_t Count() const;
    void Merge(const HyperLogLog &other);
};

uint64_t
MurmurHash64A(const void *key, size_t len, uint64_t seed) noexcept;

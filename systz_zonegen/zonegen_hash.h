#ifndef __ZONEGEN_HASH_H__
#define __ZONEGEN_HASH_H__

#include <cstddef>
#include <cstdint>
#include <string_view>

// 64-bit FNV-1a. The value only depends on the bytes fed in, so it is the
// same on every host and every run.
class Fnv1a64
{
private:
    static constexpr uint64_t OFFSET_BASIS = 14695981039346656037ULL;
    static constexpr uint64_t PRIME = 1099511628211ULL;

    uint64_t _state = OFFSET_BASIS;
public:
    void Update(const void* data, size_t size);

    // Little-endian, regardless of host byte order.
    void Update(uint64_t value);

    // Length-prefixed, so that ("ab", "c") and ("a", "bc") differ.
    void Update(std::string_view value);

    uint64_t Finish() const { return _state; }
};

#endif // __ZONEGEN_HASH_H__

#include "zonegen_hash.h"

void Fnv1a64::Update(const void* data, size_t size)
{
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < size; ++i)
    {
        _state ^= bytes[i];
        _state *= PRIME;
    }
}

void Fnv1a64::Update(uint64_t value)
{
    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i)
    {
        bytes[i] = static_cast<uint8_t>(value >> (i * 8));
    }
    Update(bytes, sizeof(bytes));
}

void Fnv1a64::Update(std::string_view value)
{
    Update(static_cast<uint64_t>(value.size()));
    Update(value.data(), value.size());
}

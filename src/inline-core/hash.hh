#pragma once

#include <inline-core/fwd.hh>

#include <cstddef>
#include <functional>

// Hashing helpers for inline-core containers.
// Containers specialize std::hash in terms of these, so hashes only depend on the element sequence:
//   std::hash<ic::fixed_vector<int, 4>>{}(a) == std::hash<ic::fixed_vector<int, 16>>{}(b)   if a == b
//
// hash_combine(seed, h)        - mixes h into seed (boost-style golden ratio mixing)
// hash_range(begin, end)       - combined std::hash of every element, seeded with the element count

namespace ic
{
[[nodiscard]] constexpr std::size_t hash_combine(std::size_t seed, std::size_t h)
{
    return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

template <class T>
[[nodiscard]] std::size_t hash_range(T const* begin, T const* end)
{
    std::size_t seed = std::size_t(end - begin);
    for (; begin != end; ++begin)
        seed = hash_combine(seed, std::hash<T>{}(*begin));
    return seed;
}
} // namespace ic

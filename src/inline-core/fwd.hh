#pragma once

#include <cstddef>
#include <cstdint>

namespace ic
{
// sizes, indices and capacities are signed: an empty range ends at index -1, not at SIZE_MAX
using i64 = std::int64_t;
using isize = i64;

using byte = std::byte;

// vocabulary
struct unit;
struct sentinel;
struct nullopt_t;
template <class T>
struct optional;
template <class E>
struct as_error_t;
template <class T, class E>
struct result;
template <class P>
struct capacity_error;

// views
template <class T>
struct span;

// inline-storage containers
template <class T, isize N>
struct fixed_array;
template <class T, isize N>
struct fixed_vector;
template <class T, isize N>
struct fixed_vector_drain;
} // namespace ic

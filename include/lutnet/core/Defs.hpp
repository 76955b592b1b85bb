#ifndef LUTNET_CORE_DEFS_HPP
#define LUTNET_CORE_DEFS_HPP

#include <cstddef>

// Check for OpenMP support
#if defined(_OPENMP)
#include <omp.h>
#define LUTNET_SIMD_LOOP _Pragma("omp simd")
#define LUTNET_PARALLEL_LOOP _Pragma("omp parallel for")
#else
#define LUTNET_SIMD_LOOP
#define LUTNET_PARALLEL_LOOP
#endif

namespace lutnet {

// Tables are allocated on cache line boundaries
constexpr std::size_t kTableAlignment = 64;

// Upper bound on the number of entries a single table may hold (2^24 floats = 64 MiB)
constexpr std::size_t kMaxTableEntries = std::size_t(1) << 24;

// Largest bit width accepted when the domain is given as 2^bits
constexpr int kMaxInputBits = 24;

} // namespace lutnet

#endif // LUTNET_CORE_DEFS_HPP

#pragma once

#include <cstdint>

#define DUPFIND_EXPORT __attribute__((visibility("default")))

namespace dupfind {

// 1MiB, read buffer of a single hashing worker
constexpr auto buf_sz = 1024UL * 1024UL;
// 4KiB, head block hashed by the prefilter
constexpr auto head_blk_sz = 4096UL;
// 64KiB, per-file buffer of the exact compare
constexpr auto cmp_blk_sz = 64UL * 1024UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

constexpr uint32_t max_jobs = 256;

}  // namespace dupfind

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dupfind/file_entry.hh"
#include "dupfind/hasher.hh"
#include "dupfind/size_bucket.hh"

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief hashing progress, safe to poll from any thread
 */
struct progress_t {
  std::atomic<uint64_t> total{0};
  std::atomic<uint64_t> done{0};
};

/**
 * @brief a size bucket with the digest of every member,
 * digests[i] belongs to bucket.files[i], nullopt if hashing failed
 */
struct hashed_bucket_t {
  size_bucket_t bucket;
  std::vector<std::optional<std::string>> digests;
};

using hashed_bucket_vec = std::vector<hashed_bucket_t>;

/**
 * @brief split buckets by the hash of the first head_blk_sz bytes,
 * buckets of files not larger than head_blk_sz are passed through
 *
 * @param buckets size buckets, consumed
 * @param num_thread worker count
 * @param[out] failures files whose head could not be read
 * @return buckets with at least 2 members, member order kept
 */
size_bucket_vec prefilter(size_bucket_vec buckets, uint32_t num_thread,
                          failure_vec &failures);

/**
 * @brief compute the digest of every candidate once on a thread pool
 *
 * @param buckets size buckets, consumed
 * @param algo digest algorithm
 * @param num_thread worker count
 * @param progress total is set before dispatch, done counts finished files
 * @param[out] failures files that could not be hashed
 */
hashed_bucket_vec hash_buckets(size_bucket_vec buckets, hash_algo_t algo,
                               uint32_t num_thread, progress_t &progress,
                               failure_vec &failures);

}  // namespace detail_v1

}  // namespace dupfind

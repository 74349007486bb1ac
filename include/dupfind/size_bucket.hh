#pragma once

#include <cstdint>
#include <vector>

#include "dupfind/file_entry.hh"

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief files sharing one exact byte length, in discovery order.
 * the order decides which copy is kept later.
 */
struct size_bucket_t {
  uint64_t size = 0;
  file_entry_vec files;
};

using size_bucket_vec = std::vector<size_bucket_t>;

/**
 * @brief group files by size, drop sizes seen only once
 *
 * @param file_list files in discovery order, consumed
 * @param sort_paths order each bucket by path instead of discovery order
 * @return buckets with at least 2 members, largest size first
 */
size_bucket_vec bucket_by_size(file_entry_vec file_list,
                               bool sort_paths = false);

// number of files across buckets
uint64_t candidate_count(const size_bucket_vec &buckets) noexcept;

}  // namespace detail_v1

}  // namespace dupfind

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dupfind/file_entry.hh"
#include "dupfind/hash_scheduler.hh"

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief files of equal size and equal digest.
 * files[0] is kept, the rest are duplicates of it.
 */
struct hash_group_t {
  std::string digest;
  uint64_t size = 0;
  file_entry_vec files;
};

using hash_group_vec = std::vector<hash_group_t>;

/**
 * @brief duplicate sets with aggregate counts, read-only once built
 */
class dupe_report_t {
  uint64_t _total_groups = 0;
  uint64_t _total_duplicates = 0;
  uint64_t _wasted_space = 0;
  hash_group_vec _groups;

 public:
  dupe_report_t() = default;
  // groups with fewer than 2 members are dropped
  explicit dupe_report_t(hash_group_vec groups);

  inline uint64_t total_groups() const noexcept { return _total_groups; }
  inline uint64_t total_duplicates() const noexcept {
    return _total_duplicates;
  }
  inline uint64_t wasted_space() const noexcept { return _wasted_space; }
  inline const hash_group_vec &groups() const noexcept { return _groups; }
  inline bool empty() const noexcept { return _groups.empty(); }
};

/**
 * @brief group the hashed members of each bucket by digest
 * failed members are ignored, singleton groups are dropped,
 * groups of a bucket appear in order of their first member
 */
hash_group_vec group_by_digest(const hashed_bucket_vec &hashed);

}  // namespace detail_v1

}  // namespace dupfind

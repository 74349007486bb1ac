#include "dupfind/grouper.hh"

#include <algorithm>
#include <unordered_map>

namespace dupfind {

inline namespace detail_v1 {

dupe_report_t::dupe_report_t(hash_group_vec groups) {
  std::erase_if(groups,
                [](const auto &group) { return group.files.size() < 2; });
  for (const auto &group : groups) {
    const uint64_t dupes = group.files.size() - 1;
    ++_total_groups;
    _total_duplicates += dupes;
    _wasted_space += group.size * dupes;
  }
  _groups = std::move(groups);
}

hash_group_vec group_by_digest(const hashed_bucket_vec &hashed) {
  hash_group_vec groups;
  for (const auto &[bucket, digests] : hashed) {
    // never compare across buckets, sizes differ
    std::unordered_map<std::string, std::size_t> group_idx;
    hash_group_vec bucket_groups;
    for (auto i = 0UL; i < bucket.files.size(); ++i) {
      if (!digests[i]) {
        continue;
      }
      auto [it, inserted] =
          group_idx.try_emplace(*digests[i], bucket_groups.size());
      if (inserted) {
        bucket_groups.push_back({*digests[i], bucket.size, {}});
      }
      bucket_groups[it->second].files.push_back(bucket.files[i]);
    }
    for (auto &group : bucket_groups) {
      if (group.files.size() > 1) {
        groups.emplace_back(std::move(group));
      }
    }
  }
  return groups;
}

}  // namespace detail_v1

}  // namespace dupfind

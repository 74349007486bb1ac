#include "dupfind/size_bucket.hh"

#include <algorithm>
#include <iterator>

namespace dupfind {

inline namespace detail_v1 {

size_bucket_vec bucket_by_size(file_entry_vec file_list,
                               const bool sort_paths) {
  // stable: equal sizes keep discovery order
  std::stable_sort(
      file_list.begin(), file_list.end(),
      [](const auto &lhs, const auto &rhs) { return lhs.size() > rhs.size(); });

  size_bucket_vec buckets;
  if (file_list.size() < 2) {
    return buckets;
  }
  // finding union of same file size
  auto union_st = file_list.begin();
  auto union_ed = union_st + 1;
  while (true) {
    if (union_ed == file_list.end() || union_ed->size() != union_st->size()) {
      // end of union
      if (std::distance(union_st, union_ed) > 1) {
        auto &bucket = buckets.emplace_back();
        bucket.size = union_st->size();
        bucket.files.assign(std::make_move_iterator(union_st),
                            std::make_move_iterator(union_ed));
        if (sort_paths) {
          std::sort(bucket.files.begin(), bucket.files.end(),
                    [](const auto &lhs, const auto &rhs) {
                      return lhs.path() < rhs.path();
                    });
        }
      }
      if (union_ed == file_list.end()) {
        break;
      }
      union_st = union_ed;
    }
    ++union_ed;
  }
  return buckets;
}

uint64_t candidate_count(const size_bucket_vec &buckets) noexcept {
  uint64_t count = 0;
  for (const auto &bucket : buckets) {
    count += bucket.files.size();
  }
  return count;
}

}  // namespace detail_v1

}  // namespace dupfind

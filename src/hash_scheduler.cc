#include "dupfind/hash_scheduler.hh"

#include <map>
#include <mutex>

#include "dupfind/config.hh"
#include "dupfind/log.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/bind/bind.hpp>

namespace dupfind {

inline namespace detail_v1 {

namespace ba = boost::asio;

namespace {

void append_failure(const file_entry_t &file, const char *what,
                    failure_vec &failures, std::mutex &mtx) {
  oss(std::cerr) << "[err] " << what << '\n';
  std::lock_guard lk(mtx);
  failures.push_back({file.path(), stage_t::hash, what});
}

void head_job(const file_entry_t &file, std::optional<head_hash_t> &slot,
              failure_vec &failures, std::mutex &mtx) {
  try {
    slot = hash_head(file.path(), head_blk_sz);
  } catch (const hash_error &e) {
    append_failure(file, e.what(), failures, mtx);
  }
}

void hash_job(const file_entry_t &file, const hash_algo_t algo,
              std::optional<std::string> &slot, progress_t &progress,
              failure_vec &failures, std::mutex &mtx) {
  try {
    slot = hash_file(file.path(), algo);
  } catch (const hash_error &e) {
    append_failure(file, e.what(), failures, mtx);
  }
  progress.done.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

size_bucket_vec prefilter(size_bucket_vec buckets, const uint32_t num_thread,
                          failure_vec &failures) {
  // head hash of each member, same layout as buckets
  std::vector<std::vector<std::optional<head_hash_t>>> heads(buckets.size());
  {
    ba::thread_pool pool(num_thread);
    std::mutex mtx;
    for (auto i = 0UL; i < buckets.size(); ++i) {
      if (buckets[i].size <= head_blk_sz) {
        continue;
      }
      auto &files = buckets[i].files;
      heads[i].resize(files.size());
      for (auto j = 0UL; j < files.size(); ++j) {
        ba::post(pool, boost::bind(head_job, boost::cref(files[j]),
                                   boost::ref(heads[i][j]),
                                   boost::ref(failures), boost::ref(mtx)));
      }
    }
    pool.join();
  }

  size_bucket_vec filtered;
  filtered.reserve(buckets.size());
  for (auto i = 0UL; i < buckets.size(); ++i) {
    auto &bucket = buckets[i];
    if (heads[i].empty()) {
      filtered.emplace_back(std::move(bucket));
      continue;
    }
    // split by head, sub buckets in order of first appearance
    std::map<head_hash_t, std::size_t> sub_idx;
    size_bucket_vec subs;
    for (auto j = 0UL; j < bucket.files.size(); ++j) {
      if (!heads[i][j]) {
        continue;
      }
      auto [it, inserted] = sub_idx.try_emplace(*heads[i][j], subs.size());
      if (inserted) {
        subs.push_back({bucket.size, {}});
      }
      subs[it->second].files.emplace_back(std::move(bucket.files[j]));
    }
    for (auto &sub : subs) {
      if (sub.files.size() > 1) {
        filtered.emplace_back(std::move(sub));
      }
    }
  }
  return filtered;
}

hashed_bucket_vec hash_buckets(size_bucket_vec buckets, const hash_algo_t algo,
                               const uint32_t num_thread, progress_t &progress,
                               failure_vec &failures) {
  // every slot exists before dispatch, workers never resize anything
  hashed_bucket_vec hashed;
  hashed.reserve(buckets.size());
  for (auto &bucket : buckets) {
    auto &item = hashed.emplace_back();
    item.digests.resize(bucket.files.size());
    item.bucket = std::move(bucket);
  }
  uint64_t total = 0;
  for (const auto &item : hashed) {
    total += item.bucket.files.size();
  }
  progress.done = 0;
  progress.total = total;

  ba::thread_pool pool(num_thread);
  std::mutex mtx;
  for (auto &item : hashed) {
    for (auto j = 0UL; j < item.bucket.files.size(); ++j) {
      ba::post(pool,
               boost::bind(hash_job, boost::cref(item.bucket.files[j]), algo,
                           boost::ref(item.digests[j]), boost::ref(progress),
                           boost::ref(failures), boost::ref(mtx)));
    }
  }
  pool.join();
  return hashed;
}

}  // namespace detail_v1

}  // namespace dupfind

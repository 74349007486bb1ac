#pragma once

#include <cstdint>
#include <filesystem>

#include "dupfind/file_entry.hh"
#include "dupfind/filter.hh"
#include "dupfind/grouper.hh"
#include "dupfind/hash_scheduler.hh"
#include "dupfind/hasher.hh"

namespace dupfind {

inline namespace detail_v1 {

// hardware concurrency, at least 1
uint32_t default_jobs() noexcept;

struct scan_opt_t {
  std::filesystem::path root = ".";
  filter_opt_t filter;
  hash_algo_t algo = hash_algo_t::sha256;
  uint32_t num_thread = default_jobs();
  // split size buckets by a head hash before full hashing
  bool prefilter = true;
  // byte-compare group members before reporting them
  bool verify = false;
  // keep the path-wise first copy instead of the first discovered
  bool sort_paths = false;
};

struct scan_stats_t {
  uint64_t files_indexed = 0;
  uint64_t candidates = 0;
  // candidates dropped by the head prefilter
  uint64_t prefiltered = 0;
  uint64_t hashed = 0;
};

struct scan_result_t {
  dupe_report_t report;
  scan_stats_t stats;
  failure_vec failures;
};

/**
 * @brief detects duplicate files using file size and content digest,
 * only files sharing their size with another file are hashed.
 * per-file errors are collected in failures and never stop the scan.
 *
 * @param opt scan options
 * @param progress hashing progress, may be polled while scan runs
 * @throws scan_error if opt.root is not an existing directory
 */
scan_result_t scan(const scan_opt_t &opt, progress_t &progress);

}  // namespace detail_v1

}  // namespace dupfind

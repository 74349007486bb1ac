#include "dupfind/dupfind.hh"

#include <algorithm>
#include <thread>

#include "dupfind/config.hh"
#include "dupfind/file_cmp.hh"
#include "dupfind/log.hh"
#include "dupfind/size_bucket.hh"
#include "dupfind/walk.hh"

namespace dupfind {

inline namespace detail_v1 {

uint32_t default_jobs() noexcept {
  return std::max(1U, std::thread::hardware_concurrency());
}

scan_result_t DUPFIND_EXPORT scan(const scan_opt_t &opt,
                                  progress_t &progress) {
  const auto num_thread = std::max(1U, opt.num_thread);
  scan_result_t result;
  auto &stats = result.stats;
  timer_t timer;

  // generate file list
  oss(log_stream()) << "[log] list files: " << opt.root << '\n';
  auto file_list = walk(opt.root, opt.filter, result.failures);
  stats.files_indexed = file_list.size();
  oss(log_stream()) << "[log] file count: " << stats.files_indexed
                    << ", elapsed: " << timer.time().count() << "ms\n";

  // group by size, unique sizes can't have duplicates
  auto buckets = bucket_by_size(std::move(file_list), opt.sort_paths);
  stats.candidates = candidate_count(buckets);
  oss(log_stream()) << "[log] candidates with matching sizes: "
                    << stats.candidates << " in " << buckets.size()
                    << " buckets\n";

  if (opt.prefilter && !buckets.empty()) {
    buckets = prefilter(std::move(buckets), num_thread, result.failures);
    stats.prefiltered = stats.candidates - candidate_count(buckets);
    oss(log_stream()) << "[log] prefilter dropped: " << stats.prefiltered
                      << ", elapsed: " << timer.time().count() << "ms\n";
  }

  stats.hashed = candidate_count(buckets);
  oss(log_stream()) << "[log] hash " << stats.hashed << " files with "
                    << to_string(opt.algo) << " on " << num_thread
                    << " threads\n";
  auto hashed = hash_buckets(std::move(buckets), opt.algo, num_thread,
                             progress, result.failures);
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";

  auto groups = group_by_digest(hashed);
  if (opt.verify && !groups.empty()) {
    oss(log_stream()) << "[log] verify " << groups.size() << " groups\n";
    groups = verify_groups(groups, num_thread, result.failures);
    oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";
  }
  result.report = dupe_report_t(std::move(groups));
  oss(log_stream()) << "[log] duplicate group count: "
                    << result.report.total_groups() << '\n';
  return result;
}

}  // namespace detail_v1

}  // namespace dupfind

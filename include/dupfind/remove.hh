#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <system_error>

#include "dupfind/file_entry.hh"
#include "dupfind/grouper.hh"

namespace dupfind {

inline namespace detail_v1 {

enum class rm_t {
  log,       // log entry only
  remove,    // remove file
  soft_rel,  // replace with relative path symlink
  soft_abs,  // replace with absolute path symlink
  hard       // replace with hard link
};

/**
 * @brief parse a link kind: "hard", "soft" (absolute) or "soft-rel"
 * @throws std::invalid_argument on any other name
 */
rm_t parse_link_kind(std::string_view name);

struct rm_stats_t {
  uint64_t removed = 0;
  uint64_t bytes_freed = 0;
  failure_vec failures;
};

/**
 * @brief act on one duplicate, keep_path is never touched.
 * links are created beside dup_path and renamed over it,
 * so dup_path survives a failed link.
 *
 * @return error of the failed step, empty on success
 */
std::error_code rm_file(const std::filesystem::path &dup_path,
                        const std::filesystem::path &keep_path,
                        rm_t rm_meth) noexcept;

/**
 * @brief act on every member but the first of each group.
 * each file is handled on its own, a failure never stops the pass.
 * a group whose kept file is gone is skipped entirely.
 * with rm_t::hard, a duplicate already linked to the kept file is
 * listed but not counted.
 *
 * @param out receives one entry per handled duplicate
 * @return counts, for rm_t::log what would have been done
 */
rm_stats_t remove_dupes(const dupe_report_t &report, rm_t rm_meth,
                        std::ostream &out);

}  // namespace detail_v1

}  // namespace dupfind

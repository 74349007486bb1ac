#pragma once

#include <filesystem>
#include <stdexcept>

#include "dupfind/file_entry.hh"
#include "dupfind/filter.hh"

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief the scan root is unusable, nothing was done
 */
class scan_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief list regular files under root recursively, single-threaded
 * skip symlink, skip entries rejected by filter, skip unreadable entries
 *
 * @param root directory to scan, must exist
 * @param opt skip rules
 * @param[out] failures unreadable entries and directories
 * @return files in discovery order: the files of a directory first,
 * then its subdirectories in iteration order
 * @throws scan_error if root is not an existing directory
 */
file_entry_vec walk(const std::filesystem::path &root, const filter_opt_t &opt,
                    failure_vec &failures);

}  // namespace detail_v1

}  // namespace dupfind

#pragma once

#include <cstdint>
#include <filesystem>

#include "dupfind/file_entry.hh"
#include "dupfind/grouper.hh"

namespace dupfind {

inline namespace detail_v1 {

enum class cmp_t { equal, differ, lhs_error, rhs_error };

/**
 * @brief byte-for-byte comparison of two files
 */
cmp_t compare_files(const std::filesystem::path &lhs,
                    const std::filesystem::path &rhs);

/**
 * @brief split a group into sets of truly identical files.
 * each member joins the first set whose first member equals it,
 * unreadable members are dropped and reported.
 *
 * @return sets with at least 2 members, member order kept
 */
hash_group_vec verify_group(const hash_group_t &group, failure_vec &failures);

/**
 * @brief verify_group on every group, one job per group
 *
 * @param[out] failures members dropped because they could not be read
 */
hash_group_vec verify_groups(const hash_group_vec &groups, uint32_t num_thread,
                             failure_vec &failures);

}  // namespace detail_v1

}  // namespace dupfind

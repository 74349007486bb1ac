#pragma once

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>

#include "dupfind/grouper.hh"

namespace dupfind {

inline namespace detail_v1 {

class export_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief human readable report: aggregate header then one block per group,
 * members labelled keep (first) or dupe
 *
 * @param color use ANSI colors
 */
void print_report(std::ostream &os, const dupe_report_t &report,
                  bool color = false);

/**
 * @brief JSON document with fields total_groups, total_duplicates,
 * wasted_space and groups [{hash, size, files}]
 */
std::string report_json(const dupe_report_t &report);

/**
 * @brief write report_json to path, replacing the file
 * @throws export_error if the file cannot be written
 */
void write_report(const std::filesystem::path &path,
                  const dupe_report_t &report);

}  // namespace detail_v1

}  // namespace dupfind

#pragma once

#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief skip rules shared by every traversal
 */
struct filter_opt_t {
  uint64_t min_size = 1;
  // lowercase, without dot; empty accepts every file
  std::vector<std::string> extensions;
  bool include_hidden = false;
  std::vector<std::regex> exclude_regex;
};

// directories never worth descending into
inline constexpr std::string_view noise_dirs[] = {
    "node_modules", ".git",   ".svn",   ".hg",   "__pycache__", ".cache",
    "target",       ".idea",  ".vscode", "vendor", "dist",       "build"};

bool is_noise_dir(std::string_view name) noexcept;

/**
 * @brief hidden-entry and noise-directory rule
 *
 * @param path entry to test, only its last component is inspected
 * @param is_dir whether the entry is a directory
 * @param include_hidden keep names starting with '.'
 */
bool should_skip(const std::filesystem::path &path, bool is_dir,
                 bool include_hidden);

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

/**
 * @brief split a comma-separated allow-list ("jpg, PNG,.gif")
 * into trimmed lowercase extensions without the leading dot
 */
std::vector<std::string> parse_extensions(std::string_view list);

/**
 * @brief case-insensitive extension test,
 * a file without extension never matches a non-empty list
 */
bool matches_extensions(const std::filesystem::path &path,
                        const std::vector<std::string> &extensions);

}  // namespace detail_v1

}  // namespace dupfind

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief a regular file observed during traversal,
 * size is a snapshot and is never re-checked later.
 */
class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }

  inline bool operator==(const file_entry_t &rhs) const = default;
};

using file_entry_vec = std::vector<file_entry_t>;

enum class stage_t { walk, hash, verify, remove };

/**
 * @brief a per-file error that did not stop the run
 */
struct failure_t {
  std::filesystem::path path;
  stage_t stage;
  std::string message;
};

using failure_vec = std::vector<failure_t>;

inline const char *to_string(const stage_t stage) noexcept {
  switch (stage) {
    case stage_t::walk:
      return "walk";
    case stage_t::hash:
      return "hash";
    case stage_t::verify:
      return "verify";
    case stage_t::remove:
      return "remove";
  }
  return "unknown";
}

}  // namespace detail_v1

}  // namespace dupfind

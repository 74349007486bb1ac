#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief content digest algorithms.
 * md5 is kept for comparing against other tools, not for security.
 */
enum class hash_algo_t { sha256, sha512, md5 };

const char *to_string(hash_algo_t algo) noexcept;

/**
 * @brief parse "sha256", "sha512" or "md5", case-insensitive
 * @throws std::invalid_argument on any other name
 */
hash_algo_t parse_hash_algo(std::string_view name);

// length of the hex digest
std::size_t hex_len(hash_algo_t algo) noexcept;

class hash_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief stream a whole file through the digest with a fixed-size buffer
 *
 * @return lowercase hex digest
 * @throws hash_error if the file cannot be opened or read
 */
std::string hash_file(const std::filesystem::path &path, hash_algo_t algo);

// 128 bit non-cryptographic hash of a file head
struct head_hash_t {
  uint64_t high64 = 0;
  uint64_t low64 = 0;

  auto operator<=>(const head_hash_t &rhs) const = default;
};

/**
 * @brief XXH3-128 of the first len bytes (or the whole file if shorter)
 * @throws hash_error if the file cannot be opened or read
 */
head_hash_t hash_head(const std::filesystem::path &path, uint64_t len);

}  // namespace detail_v1

}  // namespace dupfind

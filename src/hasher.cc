#include "dupfind/hasher.hh"

#include <openssl/evp.h>
#include <xxhash.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

#include "dupfind/config.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace {

// RAII wrapper for libcrypto digest context.
class md_ctx_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit md_ctx_t(const EVP_MD *md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw hash_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      EVP_MD_CTX_free(_ctx);
      throw hash_error("EVP_DigestInit_ex failed");
    }
  }
  ~md_ctx_t() noexcept { EVP_MD_CTX_free(_ctx); }

  md_ctx_t(const md_ctx_t &rhs) = delete;
  md_ctx_t(md_ctx_t &&rhs) = delete;
  md_ctx_t &operator=(const md_ctx_t &rhs) = delete;
  md_ctx_t &operator=(md_ctx_t &&rhs) = delete;

  void update(const char *data, const std::size_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw hash_error("EVP_DigestUpdate failed");
    }
  }
  std::string hex_digest() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
      throw hash_error("EVP_DigestFinal_ex failed");
    }
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(md_len * 2U);
    for (auto i = 0U; i < md_len; ++i) {
      hex.push_back(digits[md[i] >> 4]);
      hex.push_back(digits[md[i] & 0xF]);
    }
    return hex;
  }
};

// RAII wrapper for xxhash library.
class xxh_t {
  XXH3_state_t *_state;

 public:
  xxh_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw hash_error("XXH3_createState failed");
    }
    if (XXH3_128bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
      XXH3_freeState(_state);
      throw hash_error("XXH3_128bits_reset_withSeed failed");
    }
  }
  ~xxh_t() noexcept { XXH3_freeState(_state); }

  xxh_t(const xxh_t &rhs) = delete;
  xxh_t(xxh_t &&rhs) = delete;
  xxh_t &operator=(const xxh_t &rhs) = delete;
  xxh_t &operator=(xxh_t &&rhs) = delete;

  void update(const char *data, const std::size_t size) {
    if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
      throw hash_error("XXH3_128bits_update failed");
    }
  }
  head_hash_t digest() noexcept {
    auto hash = XXH3_128bits_digest(_state);
    return {hash.high64, hash.low64};
  }
};

const EVP_MD *evp_md(const hash_algo_t algo) noexcept {
  switch (algo) {
    case hash_algo_t::sha256:
      return EVP_sha256();
    case hash_algo_t::sha512:
      return EVP_sha512();
    case hash_algo_t::md5:
      return EVP_md5();
  }
  return nullptr;
}

std::ifstream open_file(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw hash_error("cannot open: " + path.string());
  }
  return ifs;
}

}  // namespace

const char *to_string(const hash_algo_t algo) noexcept {
  switch (algo) {
    case hash_algo_t::sha256:
      return "sha256";
    case hash_algo_t::sha512:
      return "sha512";
    case hash_algo_t::md5:
      return "md5";
  }
  return "unknown";
}

hash_algo_t parse_hash_algo(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (lower == "sha256") {
    return hash_algo_t::sha256;
  }
  if (lower == "sha512") {
    return hash_algo_t::sha512;
  }
  if (lower == "md5") {
    return hash_algo_t::md5;
  }
  throw std::invalid_argument("unsupported hash algorithm: " +
                              std::string(name) +
                              " (use sha256, sha512 or md5)");
}

std::size_t hex_len(const hash_algo_t algo) noexcept {
  switch (algo) {
    case hash_algo_t::sha256:
      return 64;
    case hash_algo_t::sha512:
      return 128;
    case hash_algo_t::md5:
      return 32;
  }
  return 0;
}

std::string hash_file(const std::filesystem::path &path,
                      const hash_algo_t algo) {
  auto ifs = open_file(path);
  md_ctx_t ctx(evp_md(algo));
  std::vector<char> buf(buf_sz);
  while (ifs) {
    ifs.read(buf.data(), (std::streamsize)buf.size());
    const auto read_len = ifs.gcount();
    if (read_len > 0) {
      ctx.update(buf.data(), (std::size_t)read_len);
    }
  }
  if (ifs.bad()) {
    throw hash_error("read error: " + path.string());
  }
  return ctx.hex_digest();
}

head_hash_t hash_head(const std::filesystem::path &path, const uint64_t len) {
  auto ifs = open_file(path);
  xxh_t hasher;
  std::vector<char> buf(std::min<uint64_t>(len, buf_sz));
  auto remain = len;
  while (remain > 0 && ifs) {
    const auto read_sz = std::min<uint64_t>(remain, buf.size());
    ifs.read(buf.data(), (std::streamsize)read_sz);
    const auto read_len = ifs.gcount();
    if (read_len > 0) {
      hasher.update(buf.data(), (std::size_t)read_len);
      remain -= (uint64_t)read_len;
    }
  }
  if (ifs.bad()) {
    throw hash_error("read error: " + path.string());
  }
  return hasher.digest();
}

}  // namespace detail_v1

}  // namespace dupfind

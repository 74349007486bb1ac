#include "dupfind/parse_size.hh"

#include <array>
#include <cctype>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace dupfind {

namespace utils {

namespace {

// overflow checked multiply
uint64_t mul_ul(const uint64_t lhs, const uint64_t rhs,
                std::string_view size_str) {
  if (rhs != 0 && lhs > std::numeric_limits<uint64_t>::max() / rhs) {
    throw std::out_of_range("size too large: " + std::string(size_str));
  }
  return lhs * rhs;
}

bool is_num(char c) { return c >= '0' && c <= '9'; }

}  // namespace

uint64_t parse_size(std::string_view size_str) {
  const auto invalid = [size_str] {
    return std::invalid_argument("invalid size string: " +
                                 std::string(size_str));
  };
  auto str = size_str;
  while (!str.empty() && std::isspace((unsigned char)str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && std::isspace((unsigned char)str.back())) {
    str.remove_suffix(1);
  }
  if (str.empty() || !is_num(str.front())) {
    throw invalid();
  }

  uint64_t size_num = 0;
  std::size_t i = 0;
  for (; i < str.size() && is_num(str[i]); ++i) {
    size_num = mul_ul(size_num, 10, size_str);
    const auto digit = (uint64_t)(str[i] - '0');
    if (size_num > std::numeric_limits<uint64_t>::max() - digit) {
      throw std::out_of_range("size too large: " + std::string(size_str));
    }
    size_num += digit;
  }

  constexpr std::array<char, 6> unit_dict({'K', 'M', 'G', 'T', 'P', 'E'});
  std::size_t scale = 0;
  bool as_bibyte = false;
  bool as_bit = false;

  if (i < str.size()) {
    for (std::size_t j = 0; j < unit_dict.size(); ++j) {
      if (str[i] == unit_dict[j] || str[i] == unit_dict[j] + 32) {
        scale = j + 1;
        ++i;
        break;
      }
    }
    if (scale != 0 && i < str.size() && str[i] == 'i') {
      as_bibyte = true;
      ++i;
    }
    if (i < str.size()) {
      if (str[i] == 'b') {
        as_bit = true;
      } else if (str[i] != 'B') {
        throw invalid();
      }
      ++i;
    }
    if (i != str.size()) {
      throw invalid();
    }
  }

  const uint64_t base = as_bibyte ? 1024 : 1000;
  for (std::size_t j = 0; j < scale; ++j) {
    size_num = mul_ul(size_num, base, size_str);
  }
  return as_bit ? size_num / 8 : size_num;
}

std::string format_size(const uint64_t size) {
  constexpr std::array<const char *, 7> units(
      {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"});
  if (size < 1024) {
    return std::to_string(size) + " B";
  }
  auto value = (double)size;
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
  return buf;
}

}  // namespace utils

}  // namespace dupfind

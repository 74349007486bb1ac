#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dupfind {

namespace utils {

/**
 * @brief Parse a size string into a byte count.
 * "123", "4K", "4KB" (1000 based), "4KiB" (1024 based), "8Mb" (bits).
 * @throws std::invalid_argument if not a valid size string.
 * @throws std::out_of_range if the value does not fit 64 bits.
 */
uint64_t parse_size(std::string_view size_str);

/**
 * @brief Human readable binary size, "10 B", "1.50 KiB", "3.00 GiB".
 */
std::string format_size(uint64_t size);

}  // namespace utils

}  // namespace dupfind

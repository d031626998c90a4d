#ifndef CRUSH_UTILS_HPP
#define CRUSH_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::string to_lower_copy(std::string_view sv);

// "43 52 01 00" style rendering used for magic numbers.
std::string bytes_to_hex(const uint8_t *data, size_t len);

// Human readable size, e.g. "1.50 MiB".
std::string format_bytes(uint64_t bytes);

// MB/s with 1 MB = 1,000,000 bytes. Zero elapsed time yields 0.
double calculate_throughput_mbps(uint64_t bytes, double elapsed_seconds);

// output/input; an empty input yields 0.
double calculate_ratio(uint64_t input_bytes, uint64_t output_bytes);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // CRUSH_UTILS_HPP

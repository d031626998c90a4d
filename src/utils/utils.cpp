#include "utils/utils.hpp"

#include <cstdio>

namespace Utils {

std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 3);
  for (size_t i = 0; i < len; ++i) {
    if (i > 0)
      out.push_back(' ');
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string format_bytes(uint64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }

  char buffer[32];
  if (unit == 0)
    std::snprintf(buffer, sizeof(buffer), "%llu B",
                  static_cast<unsigned long long>(bytes));
  else
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, units[unit]);
  return buffer;
}

double calculate_throughput_mbps(uint64_t bytes, double elapsed_seconds) {
  if (elapsed_seconds <= 0.0)
    return 0.0;
  return (static_cast<double>(bytes) / 1'000'000.0) / elapsed_seconds;
}

double calculate_ratio(uint64_t input_bytes, uint64_t output_bytes) {
  if (input_bytes == 0)
    return 0.0;
  return static_cast<double>(output_bytes) / static_cast<double>(input_bytes);
}

} // namespace Utils

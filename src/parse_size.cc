#include "parse_size.hh"

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace utils {

namespace {

bool is_num(char c) { return c >= '0' && c <= '9'; }

char to_upper(char c) {
  return (c >= 'a' && c <= 'z') ? (char)(c - 32) : c;
}

// base^exp, throws on overflow
uint64_t pow_checked(uint64_t base, uint64_t exp, std::string_view size_str) {
  uint64_t result = 1;
  while (exp-- != 0) {
    if (result > std::numeric_limits<uint64_t>::max() / base) {
      throw std::out_of_range("size too large: " + std::string(size_str));
    }
    result *= base;
  }
  return result;
}

}  // namespace

uint64_t parse_size(std::string_view size_str) {
  constexpr std::array<char, 6> unit_dict({'K', 'M', 'G', 'T', 'P', 'E'});
  constexpr auto max = std::numeric_limits<uint64_t>::max();
  const auto invalid = [&]() {
    return std::invalid_argument("invalid size string: " +
                                 std::string(size_str));
  };

  std::size_t i = 0;
  uint64_t size_num = 0;
  for (; i < size_str.size() && is_num(size_str[i]); ++i) {
    const auto digit = (uint64_t)(size_str[i] - '0');
    if (size_num > (max - digit) / 10) {
      throw std::out_of_range("size too large: " + std::string(size_str));
    }
    size_num = size_num * 10 + digit;
  }
  if (i == 0) {
    throw invalid();
  }

  // unit prefix
  uint64_t scale = 0;
  if (i < size_str.size()) {
    const auto c = to_upper(size_str[i]);
    for (auto j = 0UL; j < unit_dict.size(); ++j) {
      if (c == unit_dict[j]) {
        scale = j + 1;
        ++i;
        break;
      }
    }
  }
  bool as_bibyte = false;
  if (scale != 0 && i < size_str.size() && size_str[i] == 'i') {
    as_bibyte = true;
    ++i;
  }
  bool as_bit = false;
  if (i < size_str.size()) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      throw invalid();
    }
    ++i;
  }
  if (i != size_str.size()) {
    throw invalid();
  }

  const auto mult = pow_checked(as_bibyte ? 1024 : 1000, scale, size_str);
  if (size_num != 0 && mult > max / size_num) {
    throw std::out_of_range("size too large: " + std::string(size_str));
  }
  return size_num * mult / (as_bit ? 8 : 1);
}

}  // namespace utils

#pragma once

#include <chrono>

namespace uniqdir {

inline namespace detail_v1 {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  // time since construction or since the last call
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

}  // namespace detail_v1

}  // namespace uniqdir

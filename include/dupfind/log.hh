#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <version>

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace dupfind {

inline namespace detail_v1 {

// osyncstream is provided
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace dupfind

#else

#include <mutex>

namespace dupfind {

inline namespace detail_v1 {

// self-implemented osyncstream
class oss {
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() { _mtx.unlock(); }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
  inline operator std::ostream &() noexcept { return _os; }
};

}  // namespace detail_v1

}  // namespace dupfind

#endif

namespace dupfind {

inline namespace detail_v1 {

// progress chatter ("[log] ...") can be silenced, warnings and errors cannot
class log_t {
  inline static std::atomic<bool> _quiet{false};

 public:
  static void set_quiet(bool quiet) noexcept { _quiet = quiet; }
  static bool quiet() noexcept { return _quiet; }
};

// null sink for silenced [log] lines
inline std::ostream &null_stream() {
  static std::ostream os(nullptr);
  return os;
}

inline std::ostream &log_stream() noexcept {
  return log_t::quiet() ? null_stream() : std::cerr;
}

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

}  // namespace detail_v1

}  // namespace dupfind

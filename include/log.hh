#pragma once

#include <chrono>
#include <version>

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace imdupe {

inline namespace detail_v1 {

// lines written from pool threads must not interleave
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace imdupe

#else

#include <iostream>
#include <mutex>

namespace imdupe {

inline namespace detail_v1 {

// holds a process-wide lock for the lifetime of one log line
class oss {
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline explicit oss(std::ostream &os) : _os(os) { _mtx.lock(); }
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
  inline oss &operator<<(std::ostream &(*manip)(std::ostream &)) {
    _os << manip;
    return *this;
  }
};

}  // namespace detail_v1

}  // namespace imdupe

#endif

namespace imdupe {

inline namespace detail_v1 {

// phase stopwatch, each call to lap() restarts it
class stopwatch_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  stopwatch_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds lap() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

}  // namespace detail_v1

}  // namespace imdupe

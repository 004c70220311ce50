#pragma once

#include <stdexcept>
#include <string>

namespace imdupe {

inline namespace detail_v1 {

// image could not be turned into a pixel grid, skip it
class decode_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// same identifier submitted twice in one run
class duplicate_identifier_error : public std::logic_error {
 public:
  explicit duplicate_identifier_error(const std::string &id)
      : std::logic_error("duplicate identifier: " + id) {}
};

class not_found_error : public std::out_of_range {
 public:
  explicit not_found_error(const std::string &id)
      : std::out_of_range("identifier not found: " + id) {}
};

// cache was written by another hash algorithm or format, discard it
class cache_version_mismatch : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// cache header unreadable, version cannot even be detected
class cache_corrupt_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace detail_v1

}  // namespace imdupe

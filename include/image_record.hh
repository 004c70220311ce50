#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "fingerprint.hh"

namespace imdupe {

inline namespace detail_v1 {

// source file stamp, also used to validate cache entries
struct file_meta_t {
  uint64_t size = 0;
  int64_t mtime = 0;  // file clock ticks since its epoch

  bool operator==(const file_meta_t &rhs) const noexcept = default;
};

class image_record_t {
  std::string _id;
  fingerprint_t _fp;
  std::optional<file_meta_t> _meta;

 public:
  template <typename Tp>
  inline image_record_t(Tp &&id, fingerprint_t fp,
                        std::optional<file_meta_t> meta = std::nullopt)
      : _id(std::forward<Tp>(id)), _fp(std::move(fp)), _meta(meta) {}

  inline image_record_t(const image_record_t &rhs) = default;
  inline image_record_t(image_record_t &&rhs) = default;
  inline image_record_t &operator=(const image_record_t &rhs) = default;
  inline image_record_t &operator=(image_record_t &&rhs) = default;

  inline const std::string &id() const noexcept { return _id; }
  inline const fingerprint_t &fingerprint() const noexcept { return _fp; }
  inline const std::optional<file_meta_t> &meta() const noexcept {
    return _meta;
  }
};

}  // namespace detail_v1

}  // namespace imdupe

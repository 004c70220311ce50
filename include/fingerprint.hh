#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace imdupe {

inline namespace detail_v1 {

inline constexpr auto div_ceil(const auto x, const auto y) noexcept {
  return (x + y - 1) / y;
}

/**
 * @brief fixed-length bit-vector fingerprint of an image.
 *
 * Bit i lives in word i / 64 at bit position i % 64. Bits past the length
 * in the last word are always zero, so word-wise popcount gives the exact
 * Hamming distance.
 */
class fingerprint_t {
  std::vector<uint64_t> _words;
  uint32_t _bits = 0;

 public:
  fingerprint_t() = default;
  explicit fingerprint_t(uint32_t bits);

  fingerprint_t(const fingerprint_t &rhs) = default;
  fingerprint_t(fingerprint_t &&rhs) noexcept = default;
  fingerprint_t &operator=(const fingerprint_t &rhs) = default;
  fingerprint_t &operator=(fingerprint_t &&rhs) noexcept = default;

  /**
   * @brief parse a string of '0' and '1', character i is bit i
   * @throws std::invalid_argument on other characters or empty input
   */
  static fingerprint_t from_bits(std::string_view bits);

  /**
   * @brief parse the hex form written by to_hex
   *
   * @param hex two digits per byte, byte k holds bits 8k..8k+7
   * @param bits fingerprint length, must fit in the digits given
   * @throws std::invalid_argument on malformed input
   */
  static fingerprint_t from_hex(std::string_view hex, uint32_t bits);

  inline uint32_t size() const noexcept { return _bits; }
  inline bool empty() const noexcept { return _bits == 0; }
  inline const std::vector<uint64_t> &words() const noexcept { return _words; }

  bool test(uint32_t idx) const noexcept;
  void set(uint32_t idx, bool val = true) noexcept;

  /**
   * @brief extract bits [first, first + width) as an integer,
   * bit first becomes the least significant bit.
   *
   * @param width at most 64
   */
  uint64_t slice(uint32_t first, uint32_t width) const noexcept;

  std::string to_hex() const;
  std::string to_bits() const;

  bool operator==(const fingerprint_t &rhs) const = default;
};

/**
 * @brief number of differing bit positions
 * @throws std::invalid_argument if the lengths differ
 */
uint32_t hamming_distance(const fingerprint_t &lhs, const fingerprint_t &rhs);

}  // namespace detail_v1

}  // namespace imdupe

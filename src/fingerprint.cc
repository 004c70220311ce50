#include "fingerprint.hh"

#include <bit>
#include <stdexcept>

namespace imdupe {

inline namespace detail_v1 {

fingerprint_t::fingerprint_t(uint32_t bits)
    : _words(div_ceil(bits, 64U), 0UL), _bits(bits) {}

fingerprint_t fingerprint_t::from_bits(std::string_view bits) {
  if (bits.empty()) {
    throw std::invalid_argument("empty bit string");
  }
  fingerprint_t fp((uint32_t)bits.size());
  for (auto i = 0U; i < fp._bits; ++i) {
    if (bits[i] == '1') {
      fp.set(i);
    } else if (bits[i] != '0') {
      throw std::invalid_argument("invalid bit string: " + std::string(bits));
    }
  }
  return fp;
}

static int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

fingerprint_t fingerprint_t::from_hex(std::string_view hex, uint32_t bits) {
  if (bits == 0 || hex.size() != 2 * div_ceil(bits, 8U)) {
    throw std::invalid_argument("hex fingerprint of wrong length: " +
                                std::string(hex));
  }
  fingerprint_t fp(bits);
  for (auto byte = 0U; byte < hex.size() / 2; ++byte) {
    const auto hi = hex_value(hex[2 * byte]);
    const auto lo = hex_value(hex[2 * byte + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("invalid hex fingerprint: " +
                                  std::string(hex));
    }
    const auto val = (uint64_t)(hi << 4 | lo);
    const auto first = byte * 8U;
    if (first + 8U > bits && (val >> (bits - first)) != 0) {
      // padding bits must stay zero
      throw std::invalid_argument("hex fingerprint has bits past its length: " +
                                  std::string(hex));
    }
    fp._words[first / 64U] |= val << (first % 64U);
  }
  return fp;
}

bool fingerprint_t::test(uint32_t idx) const noexcept {
  return (_words[idx / 64U] >> (idx % 64U)) & 1UL;
}

void fingerprint_t::set(uint32_t idx, bool val) noexcept {
  const auto mask = 1UL << (idx % 64U);
  if (val) {
    _words[idx / 64U] |= mask;
  } else {
    _words[idx / 64U] &= ~mask;
  }
}

uint64_t fingerprint_t::slice(uint32_t first, uint32_t width) const noexcept {
  const auto word = first / 64U;
  const auto shift = first % 64U;
  uint64_t val = _words[word] >> shift;
  // block straddles two words
  if (shift != 0 && shift + width > 64U && word + 1 < _words.size()) {
    val |= _words[word + 1] << (64U - shift);
  }
  if (width < 64U) {
    val &= (1UL << width) - 1UL;
  }
  return val;
}

std::string fingerprint_t::to_hex() const {
  constexpr std::string_view digits = "0123456789abcdef";
  const auto bytes = div_ceil(_bits, 8U);
  std::string hex;
  hex.reserve(2 * bytes);
  for (auto byte = 0U; byte < bytes; ++byte) {
    const auto val = (_words[byte / 8U] >> (byte % 8U * 8U)) & 0xffUL;
    hex += digits[val >> 4];
    hex += digits[val & 0xfUL];
  }
  return hex;
}

std::string fingerprint_t::to_bits() const {
  std::string bits(_bits, '0');
  for (auto i = 0U; i < _bits; ++i) {
    if (test(i)) {
      bits[i] = '1';
    }
  }
  return bits;
}

uint32_t hamming_distance(const fingerprint_t &lhs, const fingerprint_t &rhs) {
  if (lhs.size() != rhs.size()) {
    throw std::invalid_argument("hamming distance of unequal lengths");
  }
  uint32_t dist = 0;
  const auto &lw = lhs.words();
  const auto &rw = rhs.words();
  for (std::size_t i = 0; i < lw.size(); ++i) {
    dist += (uint32_t)std::popcount(lw[i] ^ rw[i]);
  }
  return dist;
}

}  // namespace detail_v1

}  // namespace imdupe

#pragma once

#include <cstdint>
#include <string_view>

#define IMDUPE_EXPORT __attribute__((visibility("default")))

namespace imdupe {

// side of the normalized grid produced by decoders
constexpr auto grid_side = 32U;

// bump when the hash transform or the cache layout changes
constexpr auto cache_format_version = 1U;
constexpr std::string_view cache_magic = "imdupe-cache";

constexpr auto hash_seed = 0x178ee47c0190226cUL;

// allowable Hamming distance for 64-bit fingerprints
constexpr auto default_threshold = 4U;

constexpr auto default_max_thread = 8U;

}  // namespace imdupe

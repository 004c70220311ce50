#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <regex>
#include <system_error>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "image_record.hh"

namespace imdupe {

inline namespace detail_v1 {

struct image_entry_t {
  std::filesystem::path path;
  file_meta_t meta;
};

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

// case-insensitive match against the known image extensions
bool is_image(const std::filesystem::path &path);

/**
 * @brief size and modification time of a file
 *
 * @param[out] ec set on failure
 */
file_meta_t stat_file(const std::filesystem::path &path, std::error_code &ec);

/**
 * @brief list image files under a directory recursively
 *
 * @param dir directory path
 * @param[out] entries non-empty image files, no order guarantee
 * @param mtx mutex for protecting entries
 * @param pool thread pool for recursive calls
 * @param exclude_regex regular expression to exclude files or directories
 */
void ls_dir_rec(const std::filesystem::path dir,
                std::vector<image_entry_t> &entries, std::mutex &mtx,
                boost::asio::thread_pool &pool,
                const std::vector<std::regex> &exclude_regex);

/**
 * @brief list image files under every search directory, sorted by path
 *
 * @param search_dir directories to search
 * @param exclude_regex regular expression to exclude files or directories
 * @param max_thread maximum number of threads to use
 */
std::vector<image_entry_t> list_images(
    const std::vector<std::filesystem::path> &search_dir,
    const std::vector<std::regex> &exclude_regex, const uint32_t max_thread);

}  // namespace detail_v1

}  // namespace imdupe

#include "ls_dir_rec.hh"

#include <algorithm>
#include <array>
#include <boost/asio.hpp>
#include <cctype>
#include <functional>
#include <iostream>
#include <string_view>

#include "log.hh"

namespace imdupe {

inline namespace detail_v1 {

using namespace std::literals;

constexpr std::array image_exts{".jpg"sv,  ".jpeg"sv, ".jpe"sv, ".jfif"sv,
                                ".png"sv,  ".gif"sv,  ".bmp"sv, ".pgm"sv,
                                ".pbm"sv,  ".ppm"sv,  ".tif"sv, ".tiff"sv,
                                ".webp"sv};

bool is_image(const std::filesystem::path &path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return std::find(image_exts.begin(), image_exts.end(), ext) !=
         image_exts.end();
}

file_meta_t stat_file(const std::filesystem::path &path, std::error_code &ec) {
  file_meta_t meta;
  meta.size = std::filesystem::file_size(path, ec);
  if (ec) {
    return meta;
  }
  const auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return meta;
  }
  meta.mtime = (int64_t)mtime.time_since_epoch().count();
  return meta;
}

void ls_dir_rec(const std::filesystem::path dir,
                std::vector<image_entry_t> &entries, std::mutex &mtx,
                boost::asio::thread_pool &pool,
                const std::vector<std::regex> &exclude_regex) {
  std::vector<image_entry_t> entries_tmp;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      if (is_excluded(dir_entry.path(), exclude_regex)) {
        // exclude, skip
        oss(std::cerr) << "[log] exclude: " << dir_entry.path() << '\n';

      } else if (dir_entry.is_symlink()) {
        // symlink, skip
        oss(std::cerr) << "[warn] skip symlink: " << dir_entry.path() << '\n';

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        boost::asio::post(
            pool,
            std::bind(ls_dir_rec, dir_entry.path(), std::ref(entries),
                      std::ref(mtx), std::ref(pool), std::cref(exclude_regex)));

      } else if (dir_entry.is_regular_file()) {
        if (!is_image(dir_entry.path())) {
          // not an image, skip silently
          continue;
        }
        std::error_code ec;
        auto meta = stat_file(dir_entry.path(), ec);
        if (ec) {
          // error reading file stamp, skip
          oss(std::cerr) << "[warn] skip file: " << dir_entry.path() << " - "
                         << ec.message() << '\n';
        } else if (meta.size > 0) {
          entries_tmp.push_back({dir_entry.path(), meta});
        }
      }
    }
  } catch (std::filesystem::filesystem_error &e) {
    // error iterate directory, skip
    oss(std::cerr) << "[warn] skip directory: " << dir << " - "
                   << e.code().message() << '\n';
  }

  // append to global list
  if (!entries_tmp.empty()) {
    std::lock_guard lk(mtx);
    entries.insert(entries.end(), std::make_move_iterator(entries_tmp.begin()),
                   std::make_move_iterator(entries_tmp.end()));
  }
}

std::vector<image_entry_t> list_images(
    const std::vector<std::filesystem::path> &search_dir,
    const std::vector<std::regex> &exclude_regex, const uint32_t max_thread) {
  std::vector<image_entry_t> entries;
  {
    boost::asio::thread_pool pool(max_thread);
    std::mutex mtx;
    for (const auto &dir : search_dir) {
      if (is_excluded(dir, exclude_regex)) {
        oss(std::cerr) << "[log] exclude: " << dir << '\n';
        continue;
      }
      boost::asio::post(
          pool, std::bind(ls_dir_rec, dir, std::ref(entries), std::ref(mtx),
                          std::ref(pool), std::cref(exclude_regex)));
    }
    pool.join();
  }
  // listing order depends on scheduling, insertion order must not
  std::sort(entries.begin(), entries.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.path < rhs.path; });
  // overlapping search directories list the same file twice
  entries.erase(std::unique(entries.begin(), entries.end(),
                            [](const auto &lhs, const auto &rhs) {
                              return lhs.path == rhs.path;
                            }),
                entries.end());
  return entries;
}

}  // namespace detail_v1

}  // namespace imdupe

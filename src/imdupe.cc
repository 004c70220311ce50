#include "imdupe.hh"

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>

#include "error.hh"
#include "hash_cache.hh"
#include "log.hh"

namespace imdupe {

inline namespace detail_v1 {

uint32_t similarity_to_threshold(double percent, uint32_t bits) {
  if (!(percent >= 0.0 && percent <= 100.0)) {
    throw std::invalid_argument("similarity must be within [0, 100]");
  }
  const double max_dist = bits / 4.0;
  return (uint32_t)std::lround((100.0 - percent) / 100.0 * max_dist);
}

uint32_t default_threshold_for(hash_algo_t algo) noexcept {
  return default_threshold * hash_bits(algo) / 64U;
}

namespace {

// outcome of one image, written only by the worker that owns the slot
struct slot_t {
  std::optional<fingerprint_t> fp;
  std::string error;
};

void fingerprint_one(const image_entry_t &entry, const decoder_t &decoder,
                     hash_algo_t algo, slot_t &slot,
                     const std::atomic<bool> &cancel) {
  if (cancel.load(std::memory_order_relaxed)) {
    // abandoned, leaves the slot empty
    return;
  }
  try {
    slot.fp = extract(decoder.decode(entry.path), algo);
  } catch (const decode_error &e) {
    slot.error = e.what();
  } catch (const std::exception &e) {
    // anything thrown while reading one image only costs that image
    slot.error = e.what();
  }
}

}  // namespace

run_result_t IMDUPE_EXPORT run(const std::vector<image_entry_t> &entries,
                               const config_t &cfg, const decoder_t &decoder,
                               const std::atomic<bool> &cancel) {
  if (cfg.max_thread == 0) {
    throw std::invalid_argument("max_thread must be > 0");
  }
  stopwatch_t timer;
  run_result_t result;

  hash_cache_t cache(cfg.algo);
  if (cfg.cache_path.has_value()) {
    auto reason = cache.load(*cfg.cache_path);
    if (reason.has_value()) {
      oss(std::cerr) << "[warn] discard cache: " << *cfg.cache_path << " - "
                     << *reason << '\n';
      result.cache_warnings.push_back("discarded " +
                                      cfg.cache_path->string() + ": " +
                                      *reason);
    } else {
      oss(std::cerr) << "[log] cache entries: " << cache.size() << '\n';
    }
  }

  // fingerprint images, workers only touch their own slot
  std::vector<slot_t> slots(entries.size());
  oss(std::cerr) << "[log] fingerprint images..." << '\n';
  {
    boost::asio::thread_pool pool(cfg.max_thread);
    for (std::size_t i = 0; i < entries.size(); ++i) {
      const auto *hit = cache.lookup(entries[i].path.string(), entries[i].meta);
      if (hit != nullptr) {
        slots[i].fp = hit->fp;
        ++result.cache_hits;
        continue;
      }
      boost::asio::post(pool, [&, i] {
        fingerprint_one(entries[i], decoder, cfg.algo, slots[i], cancel);
      });
    }
    pool.join();
  }
  oss(std::cerr) << "[log] elapsed: " << timer.lap().count() << "ms" << '\n';
  oss(std::cerr) << "[log] cache hits: " << result.cache_hits << '\n';

  // single writer, insertion follows the order of entries
  for (std::size_t i = 0; i < entries.size(); ++i) {
    auto id = entries[i].path.string();
    if (slots[i].fp.has_value()) {
      result.store.insert(id, std::move(*slots[i].fp), entries[i].meta);
    } else if (!slots[i].error.empty()) {
      oss(std::cerr) << "[warn] skip image: " << entries[i].path << " - "
                     << slots[i].error << '\n';
      result.skipped.push_back({std::move(id), std::move(slots[i].error)});
    }
  }
  oss(std::cerr) << "[log] image count: " << result.store.size() << '\n';
  oss(std::cerr) << "[log] skipped count: " << result.skipped.size() << '\n';

  if (cancel.load()) {
    oss(std::cerr) << "[log] cancelled before grouping" << '\n';
    result.cancelled = true;
    return result;
  }

  // group similar fingerprints
  oss(std::cerr) << "[log] group similar images..." << '\n';
  auto index = make_index(cfg.index, result.store, cfg.threshold);
  index->build();
  result.groups = group(result.store, *index, cfg.threshold);
  oss(std::cerr) << "[log] elapsed: " << timer.lap().count() << "ms" << '\n';
  oss(std::cerr) << "[log] group count: " << result.groups.size() << '\n';

  if (cfg.cache_path.has_value()) {
    try {
      cache.save(*cfg.cache_path, result.store);
    } catch (const std::exception &e) {
      // the groups are still valid, only the next run gets slower
      oss(std::cerr) << "[err] cannot save cache: " << *cfg.cache_path
                     << " - " << e.what() << '\n';
      result.cache_warnings.push_back("not saved " +
                                      cfg.cache_path->string() + ": " +
                                      e.what());
    }
  }
  return result;
}

run_result_t IMDUPE_EXPORT run(const config_t &cfg, const decoder_t &decoder,
                               const std::atomic<bool> &cancel) {
  stopwatch_t timer;
  oss(std::cerr) << "[log] list images..." << '\n';
  const auto entries =
      list_images(cfg.search_dir, cfg.exclude_regex, cfg.max_thread);
  oss(std::cerr) << "[log] elapsed: " << timer.lap().count() << "ms" << '\n';
  oss(std::cerr) << "[log] file count: " << entries.size() << '\n';
  return run(entries, cfg, decoder, cancel);
}

}  // namespace detail_v1

}  // namespace imdupe

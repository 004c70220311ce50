#include "test_fixture.hh"

#include <cmath>
#include <stdexcept>

#include "config.hh"
#include "imdupe.hh"

using namespace imdupe_test;

namespace {

int smooth(uint32_t r, uint32_t c) {
  return (int)(128 + 100 * std::sin(r * 0.3) * std::cos(c * 0.2));
}

class PipelineTest : public temp_dir_test {
 protected:
  fake_decoder_t decoder;
  std::vector<image_entry_t> entries;
  std::atomic<bool> cancel{false};

  void add_entry(const std::string &name, int64_t mtime = 1) {
    entries.push_back({temp_dir / name, file_meta_t{1024, mtime}});
  }

  // five images: a and its noisy copy b, two unrelated ones, one broken
  void SetUp() override {
    temp_dir_test::SetUp();
    for (const auto *name : {"a.png", "b.png", "c.png", "d.png", "e.png"}) {
      add_entry(name);
    }
    decoder.add((temp_dir / "a.png").string(),
                make_grid(grid_side, grid_side, smooth));
    decoder.add((temp_dir / "b.png").string(),
                make_grid(grid_side, grid_side, [](uint32_t r, uint32_t c) {
                  return std::clamp(
                      smooth(r, c) + (int)((r * 7 + c * 13) % 5) - 2, 0, 255);
                }));
    decoder.add((temp_dir / "c.png").string(), noise_grid(grid_side, 71));
    decoder.add((temp_dir / "d.png").string(), noise_grid(grid_side, 73));
  }

  const dupe_group_t &group_of(const run_result_t &result,
                               const std::string &name) {
    const auto id = (temp_dir / name).string();
    for (const auto &grp : result.groups) {
      for (const auto &member : grp.members) {
        if (member == id) {
          return grp;
        }
      }
    }
    throw std::out_of_range("no group for " + id);
  }
};

std::size_t member_count(const run_result_t &result) {
  std::size_t count = 0;
  for (const auto &grp : result.groups) {
    count += grp.size();
  }
  return count;
}

}  // namespace

TEST_F(PipelineTest, BrokenImageIsSkipped) {
  config_t cfg;
  const auto result = run(entries, cfg, decoder, cancel);
  ASSERT_FALSE(result.cancelled);
  ASSERT_EQ(result.store.size(), 4U);
  ASSERT_EQ(result.skipped.size(), 1U);
  ASSERT_EQ(result.skipped[0].identifier, (temp_dir / "e.png").string());
  ASSERT_FALSE(result.skipped[0].reason.empty());
  ASSERT_EQ(member_count(result), 4U);
  ASSERT_EQ(group_of(result, "a.png").members,
            (std::vector<std::string>{(temp_dir / "a.png").string(),
                                      (temp_dir / "b.png").string()}));
}

TEST_F(PipelineTest, StoreFollowsEntryOrder) {
  config_t cfg;
  cfg.max_thread = 4;
  const auto result = run(entries, cfg, decoder, cancel);
  std::vector<std::string> ids;
  for (const auto &rec : result.store) {
    ids.push_back(rec.id());
  }
  ASSERT_EQ(ids, (std::vector<std::string>{(temp_dir / "a.png").string(),
                                           (temp_dir / "b.png").string(),
                                           (temp_dir / "c.png").string(),
                                           (temp_dir / "d.png").string()}));
}

TEST_F(PipelineTest, SameGroupsForAnyThreadCount) {
  std::vector<std::vector<std::string>> first;
  for (auto threads : {1U, 2U, 8U}) {
    config_t cfg;
    cfg.max_thread = threads;
    const auto result = run(entries, cfg, decoder, cancel);
    std::vector<std::vector<std::string>> lists;
    for (const auto &grp : result.groups) {
      lists.push_back(grp.members);
    }
    if (first.empty()) {
      first = lists;
    }
    ASSERT_EQ(lists, first) << "threads=" << threads;
  }
}

TEST_F(PipelineTest, EveryIndexKindGroupsAlike) {
  std::vector<std::size_t> sizes;
  for (auto kind :
       {index_kind_t::mih, index_kind_t::bktree, index_kind_t::linear}) {
    config_t cfg;
    cfg.index = kind;
    const auto result = run(entries, cfg, decoder, cancel);
    ASSERT_EQ(group_of(result, "a.png").size(), 2U);
    sizes.push_back(result.groups.size());
  }
  ASSERT_EQ(sizes[0], sizes[1]);
  ASSERT_EQ(sizes[1], sizes[2]);
}

TEST_F(PipelineTest, MismatchedCacheIsDiscarded) {
  const auto cache_path = temp_dir / "imdupe.cache";
  touch(cache_path,
        "imdupe-cache 1 dhash 8\n"
        "ff\t1024\t1\t" + (temp_dir / "a.png").string() + "\n"
        "# xxh3 0000000000000000\n");
  config_t cfg;
  cfg.cache_path = cache_path;
  const auto result = run(entries, cfg, decoder, cancel);
  ASSERT_EQ(decoder.calls(), entries.size());
  ASSERT_EQ(result.cache_hits, 0U);
  ASSERT_FALSE(result.cache_warnings.empty());
  ASSERT_EQ(result.store.size(), 4U);
  ASSERT_EQ(result.store.fingerprint_bits(), 64U);
}

TEST_F(PipelineTest, CacheServesSecondRun) {
  config_t cfg;
  cfg.cache_path = temp_dir / "imdupe.cache";
  const auto first = run(entries, cfg, decoder, cancel);
  ASSERT_EQ(first.cache_hits, 0U);
  ASSERT_TRUE(fs::exists(*cfg.cache_path));
  const auto decoded = decoder.calls();

  const auto second = run(entries, cfg, decoder, cancel);
  ASSERT_EQ(second.cache_hits, 4U);
  ASSERT_TRUE(second.cache_warnings.empty());
  // only the broken image is tried again
  ASSERT_EQ(decoder.calls(), decoded + 1);
  for (std::size_t pos = 0; pos < first.store.size(); ++pos) {
    ASSERT_EQ(first.store.at(pos).fingerprint(),
              second.store.at(pos).fingerprint());
  }

  // a touched file is hashed again
  entries[0].meta.mtime = 2;
  const auto third = run(entries, cfg, decoder, cancel);
  ASSERT_EQ(third.cache_hits, 3U);
}

TEST_F(PipelineTest, CorruptCacheHeaderThrows) {
  const auto cache_path = temp_dir / "imdupe.cache";
  touch(cache_path, "not a cache at all\n");
  config_t cfg;
  cfg.cache_path = cache_path;
  ASSERT_THROW(run(entries, cfg, decoder, cancel), cache_corrupt_error);
}

TEST_F(PipelineTest, CancelledRunSkipsGroupingAndCache) {
  config_t cfg;
  cfg.cache_path = temp_dir / "imdupe.cache";
  cancel.store(true);
  const auto result = run(entries, cfg, decoder, cancel);
  ASSERT_TRUE(result.cancelled);
  ASSERT_TRUE(result.groups.empty());
  ASSERT_EQ(decoder.calls(), 0U);
  ASSERT_FALSE(fs::exists(*cfg.cache_path));
}

TEST_F(PipelineTest, CancelDuringExtractionKeepsFinishedImages) {
  config_t cfg;
  cfg.max_thread = 1;
  cfg.cache_path = temp_dir / "imdupe.cache";
  // the second image still completes, nothing after it starts
  decoder.on_decode([this](std::size_t call) {
    if (call == 2) {
      cancel.store(true);
    }
  });
  const auto result = run(entries, cfg, decoder, cancel);
  ASSERT_TRUE(result.cancelled);
  ASSERT_EQ(decoder.calls(), 2U);
  std::vector<std::string> ids;
  for (const auto &rec : result.store) {
    ids.push_back(rec.id());
  }
  ASSERT_EQ(ids, (std::vector<std::string>{(temp_dir / "a.png").string(),
                                           (temp_dir / "b.png").string()}));
  ASSERT_TRUE(result.skipped.empty());
  ASSERT_TRUE(result.groups.empty());
  ASSERT_FALSE(fs::exists(*cfg.cache_path));
}

TEST_F(PipelineTest, DuplicatePathThrows) {
  entries.push_back(entries[0]);
  config_t cfg;
  ASSERT_THROW(run(entries, cfg, decoder, cancel), duplicate_identifier_error);
}

TEST_F(PipelineTest, ZeroThreadsThrows) {
  config_t cfg;
  cfg.max_thread = 0;
  ASSERT_THROW(run(entries, cfg, decoder, cancel), std::invalid_argument);
}

TEST_F(PipelineTest, ListsSearchDirectories) {
  touch(temp_dir / "a.png");
  touch(temp_dir / "sub" / "c.png");
  touch(temp_dir / "notes.txt");
  decoder.add((temp_dir / "sub" / "c.png").string(), noise_grid(grid_side, 71));
  config_t cfg;
  cfg.search_dir = {temp_dir};
  cfg.max_thread = 2;
  const auto result = run(cfg, decoder, cancel);
  ASSERT_EQ(result.store.size(), 2U);
  ASSERT_NE(result.store.find((temp_dir / "sub" / "c.png").string()), nullptr);
  ASSERT_TRUE(result.skipped.empty());
}

TEST(SimilarityTest, PercentToThreshold) {
  ASSERT_EQ(similarity_to_threshold(100.0, 64), 0U);
  ASSERT_EQ(similarity_to_threshold(0.0, 64), 16U);
  ASSERT_EQ(similarity_to_threshold(90.0, 64), 2U);
  ASSERT_EQ(similarity_to_threshold(90.0, 256), 6U);
  ASSERT_THROW(similarity_to_threshold(-1.0, 64), std::invalid_argument);
  ASSERT_THROW(similarity_to_threshold(100.5, 64), std::invalid_argument);
}

TEST(SimilarityTest, DefaultThresholdFollowsLength) {
  ASSERT_EQ(default_threshold_for(hash_algo_t::dhash64), default_threshold);
  ASSERT_EQ(default_threshold_for(hash_algo_t::dhash256), 16U);
}

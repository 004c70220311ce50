#include "test_fixture.hh"

#include <sstream>

#include "grouper.hh"
#include "report.hh"

using namespace imdupe_test;

namespace {

run_result_t grouped(const std::vector<std::pair<std::string, std::string>> &fps,
                     uint32_t threshold) {
  run_result_t result;
  for (const auto &[id, bits] : fps) {
    result.store.insert(id, fingerprint_t::from_bits(bits));
  }
  linear_index_t index(result.store);
  index.build();
  result.groups = group(result.store, index, threshold);
  return result;
}

std::string printed(const run_result_t &result, const report_opts_t &opts) {
  std::ostringstream os;
  print_report(os, result, opts);
  return os.str();
}

}  // namespace

TEST(ReportTest, PrintsGroupsAndEdges) {
  const auto result = grouped(
      {{"A", "00000000"}, {"B", "00000001"}, {"C", "11111111"}}, 1);
  report_opts_t opts;
  opts.threshold = 1;
  ASSERT_EQ(printed(result, opts),
            "----\n"
            "A\n"
            "B\n"
            "  A ~ B: 1\n"
            "----\n"
            "groups: 1\n"
            "skipped: 0\n");
}

TEST(ReportTest, SingletonsOnRequest) {
  const auto result = grouped(
      {{"A", "00000000"}, {"B", "00000001"}, {"C", "11111111"}}, 1);
  report_opts_t opts;
  opts.threshold = 1;
  opts.singletons = true;
  ASSERT_EQ(printed(result, opts),
            "----\n"
            "A\n"
            "B\n"
            "  A ~ B: 1\n"
            "----\n"
            "C\n"
            "----\n"
            "groups: 2\n"
            "skipped: 0\n");
}

TEST(ReportTest, WarningsAndCancel) {
  auto result = grouped({{"A", "00000000"}}, 1);
  result.skipped.push_back({"broken.png", "not an image"});
  result.cache_warnings.push_back("discarded x.cache: old format");
  result.cancelled = true;
  ASSERT_EQ(printed(result, report_opts_t{}),
            "groups: 0\n"
            "skipped: 1\n"
            "broken.png: not an image\n"
            "cache: discarded x.cache: old format\n"
            "cancelled\n");
}

TEST(ReportTest, RefineKeepsMemberFarFromExactlyHalf) {
  // a - b - c - d, each step one bit, a and d are far from two of four
  const auto result = grouped({{"a", "00000000"},
                               {"b", "00000001"},
                               {"c", "00000011"},
                               {"d", "00000111"}},
                              1);
  ASSERT_EQ(result.groups.size(), 1U);
  const auto refined = refine_group(result.store, result.groups[0], 1);
  ASSERT_EQ(refined.members,
            (std::vector<std::string>{"a", "b", "c", "d"}));
  ASSERT_EQ(refined.edges, result.groups[0].edges);
}

TEST(ReportTest, RefineDropsChainEnds) {
  // a and e are far from three of five
  const auto result = grouped({{"a", "00000000"},
                               {"b", "00000001"},
                               {"c", "00000011"},
                               {"d", "00000111"},
                               {"e", "00001111"}},
                              1);
  ASSERT_EQ(result.groups.size(), 1U);
  const auto refined = refine_group(result.store, result.groups[0], 1);
  ASSERT_EQ(refined.members, (std::vector<std::string>{"b", "c", "d"}));
  ASSERT_EQ(refined.positions, (std::vector<std::size_t>{1, 2, 3}));
  ASSERT_EQ(refined.edges,
            (std::vector<similarity_edge_t>{{1, 2, 1}, {2, 3, 1}}));

  report_opts_t opts;
  opts.threshold = 1;
  opts.refine = true;
  ASSERT_EQ(printed(result, opts),
            "----\n"
            "b\n"
            "c\n"
            "d\n"
            "  b ~ c: 1\n"
            "  c ~ d: 1\n"
            "----\n"
            "groups: 1\n"
            "skipped: 0\n");
}

TEST(ReportTest, RefineKeepsTightGroups) {
  const auto result = grouped(
      {{"a", "00000000"}, {"b", "00000001"}, {"c", "00000010"}}, 2);
  const auto refined = refine_group(result.store, result.groups[0], 2);
  ASSERT_EQ(refined.members, result.groups[0].members);
  ASSERT_EQ(refined.edges, result.groups[0].edges);
}

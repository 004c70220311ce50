#include <atomic>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cv_decoder.hh"
#include "error.hh"
#include "imdupe.hh"
#include "report.hh"

using namespace std::literals;

namespace {

std::atomic<bool> cancel_flag{false};

void on_sigint(int) { cancel_flag.store(true); }

constexpr auto usage =
    "usage: [-i search_dir] [-e exclude_regex] [-j jobs] [-t threshold] "
    "[-s similarity%] [-b 64|256] [-x mih|bk|linear] [-c cache] "
    "[-r/--refine] [-a/--all] [-h/--help]\n"
    "default threshold is 4 for 64 bits, 16 for 256 bits";

}  // namespace

int main(int argc, char* argv[]) {
  imdupe::config_t cfg;
  imdupe::report_opts_t opts;
  std::optional<uint32_t> threshold;
  std::optional<double> similarity;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    // every option but the flags takes one value
    const bool has_value = arg == "-i"sv || arg == "-e"sv || arg == "-j"sv ||
                           arg == "-t"sv || arg == "-s"sv || arg == "-b"sv ||
                           arg == "-x"sv || arg == "-c"sv;
    if (has_value && ++i >= argc) {
      std::cerr << "missing value for " << arg << std::endl;
      return 1;
    }
    try {
      if (arg == "-i"sv) {
        cfg.search_dir.emplace_back(argv[i]);
      } else if (arg == "-e"sv) {
        try {
          cfg.exclude_regex.emplace_back(argv[i]);
        } catch (const std::regex_error&) {
          std::cerr << "invalid exclude_regex: " << argv[i] << std::endl;
          return 1;
        }
      } else if (arg == "-j"sv) {
        auto jobs = std::stoi(argv[i]);
        if (jobs <= 0 || jobs > 256) {
          std::cerr << "jobs must be > 0 and <= 256" << std::endl;
          return 1;
        }
        cfg.max_thread = (uint32_t)jobs;
      } else if (arg == "-t"sv) {
        auto val = std::stoi(argv[i]);
        if (val < 0) {
          std::cerr << "threshold must be >= 0" << std::endl;
          return 1;
        }
        threshold = (uint32_t)val;
      } else if (arg == "-s"sv) {
        similarity = std::stod(argv[i]);
      } else if (arg == "-b"sv) {
        auto algo = imdupe::algo_from_bits((uint32_t)std::stoul(argv[i]));
        if (!algo.has_value()) {
          std::cerr << "bits must be 64 or 256" << std::endl;
          return 1;
        }
        cfg.algo = *algo;
      } else if (arg == "-x"sv) {
        auto kind = imdupe::index_kind_from_name(argv[i]);
        if (!kind.has_value()) {
          std::cerr << "unknown index: " << argv[i] << std::endl;
          return 1;
        }
        cfg.index = *kind;
      } else if (arg == "-c"sv) {
        cfg.cache_path = argv[i];
      } else if (arg == "-r"sv || arg == "--refine"sv) {
        opts.refine = true;
      } else if (arg == "-a"sv || arg == "--all"sv) {
        opts.singletons = true;
      } else if (arg == "-h"sv || arg == "--help"sv) {
        std::cerr << usage << std::endl;
        return 0;
      } else {
        std::cerr << "unknown option: " << arg << std::endl;
        return 1;
      }
    } catch (const std::logic_error&) {
      // std::stoi and friends
      std::cerr << "invalid value for " << arg << ": " << argv[i] << std::endl;
      return 1;
    }
  }
  if (cfg.search_dir.empty()) {
    std::cerr << usage << std::endl;
    return 1;
  }
  if (threshold.has_value() && similarity.has_value()) {
    std::cerr << "-t and -s are exclusive" << std::endl;
    return 1;
  }
  if (similarity.has_value()) {
    try {
      cfg.threshold = imdupe::similarity_to_threshold(
          *similarity, imdupe::hash_bits(cfg.algo));
    } catch (const std::invalid_argument& e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  } else if (threshold.has_value()) {
    cfg.threshold = *threshold;
  } else {
    cfg.threshold = imdupe::default_threshold_for(cfg.algo);
  }
  opts.threshold = cfg.threshold;

  std::signal(SIGINT, on_sigint);

  try {
    imdupe::cv_decoder_t decoder;
    auto result = imdupe::run(cfg, decoder, cancel_flag);
    imdupe::print_report(std::cout, result, opts);
    return result.cancelled ? 130 : 0;
  } catch (const imdupe::cache_corrupt_error& e) {
    std::cerr << "[err] " << e.what() << " - remove the cache or pick another"
              << std::endl;
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 2;
  }
}

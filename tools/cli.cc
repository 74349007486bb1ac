#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "dupfind/config.hh"
#include "dupfind/dupfind.hh"
#include "dupfind/log.hh"
#include "dupfind/parse_size.hh"
#include "dupfind/remove.hh"
#include "dupfind/report.hh"
#include "dupfind/walk.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: dupfind [options] [path]\n"
    "Find files with identical content under path (default: .)\n"
    "options:\n"
    "  -m, --min-size SIZE   skip smaller files (default 1, e.g. 4KiB)\n"
    "                        K/M/G/T/P/E are 1000-based, Ki/Mi/.. 1024-based,\n"
    "                        trailing B is bytes, lowercase b is bits\n"
    "  -e, --ext LIST        only these extensions (e.g. jpg,png)\n"
    "  -x, --exclude REGEX   skip matching paths, repeatable\n"
    "  -a, --hidden          include hidden files and directories\n"
    "  -H, --hash ALGO       sha256 (default), sha512 or md5\n"
    "  -j, --jobs N          worker threads (default: cpu count)\n"
    "      --no-prefilter    hash whole files without the head check\n"
    "      --verify          byte-compare duplicates before reporting\n"
    "      --sort-paths      keep the path-wise first copy\n"
    "  -o, --output FILE     write JSON report to FILE\n"
    "      --delete          delete duplicates, keep first occurrence\n"
    "      --link KIND       replace duplicates with hard, soft or soft-rel "
    "links\n"
    "  -n, --dry-run         only print what --delete/--link would do\n"
    "  -c, --color           colored output\n"
    "  -q, --quiet           no progress output\n"
    "  -h, --help            this message\n";

// redraw the hashing progress line until stopped
void show_progress(std::stop_token stop, const dupfind::progress_t &progress) {
  while (!stop.stop_requested()) {
    const auto total = progress.total.load();
    if (total > 0) {
      dupfind::oss(std::cerr)
          << "\r[log] hashed " << progress.done.load() << '/' << total;
    }
    std::this_thread::sleep_for(100ms);
  }
  if (progress.total.load() > 0) {
    dupfind::oss(std::cerr) << '\n';
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  dupfind::scan_opt_t opt;
  std::optional<std::filesystem::path> output;
  std::optional<dupfind::rm_t> rm_meth;
  bool dry_run = false;
  bool color = false;
  bool quiet = false;
  bool has_root = false;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      auto value = [&]() -> std::string_view {
        ++i;
        if (i >= argc) {
          throw std::invalid_argument("missing value for " + std::string(arg));
        }
        return argv[i];
      };

      if (arg == "-m"sv || arg == "--min-size"sv) {
        opt.filter.min_size = dupfind::utils::parse_size(value());
      } else if (arg == "-e"sv || arg == "--ext"sv) {
        opt.filter.extensions = dupfind::parse_extensions(value());
      } else if (arg == "-x"sv || arg == "--exclude"sv) {
        opt.filter.exclude_regex.emplace_back(std::string(value()));
      } else if (arg == "-a"sv || arg == "--hidden"sv) {
        opt.filter.include_hidden = true;
      } else if (arg == "-H"sv || arg == "--hash"sv) {
        opt.algo = dupfind::parse_hash_algo(value());
      } else if (arg == "-j"sv || arg == "--jobs"sv) {
        const auto jobs = std::stoul(std::string(value()));
        if (jobs == 0 || jobs > dupfind::max_jobs) {
          throw std::invalid_argument("jobs must be > 0 and <= 256");
        }
        opt.num_thread = (uint32_t)jobs;
      } else if (arg == "--no-prefilter"sv) {
        opt.prefilter = false;
      } else if (arg == "--verify"sv) {
        opt.verify = true;
      } else if (arg == "--sort-paths"sv) {
        opt.sort_paths = true;
      } else if (arg == "-o"sv || arg == "--output"sv) {
        output = std::filesystem::path(value());
      } else if (arg == "--delete"sv) {
        rm_meth = dupfind::rm_t::remove;
      } else if (arg == "--link"sv) {
        rm_meth = dupfind::parse_link_kind(value());
      } else if (arg == "-n"sv || arg == "--dry-run"sv) {
        dry_run = true;
      } else if (arg == "-c"sv || arg == "--color"sv) {
        color = true;
      } else if (arg == "-q"sv || arg == "--quiet"sv) {
        quiet = true;
      } else if (arg == "-h"sv || arg == "--help"sv) {
        std::cout << usage;
        return 0;
      } else if (!arg.empty() && arg[0] == '-') {
        throw std::invalid_argument("unknown option: " + std::string(arg));
      } else if (!has_root) {
        opt.root = arg;
        has_root = true;
      } else {
        throw std::invalid_argument("unexpected extra argument: " +
                                    std::string(arg));
      }
    }
  } catch (const std::regex_error &e) {
    std::cerr << "invalid exclude regex: " << e.what() << '\n' << usage;
    return 1;
  } catch (const std::logic_error &e) {
    // invalid_argument and out_of_range, also from std::stoul
    std::cerr << e.what() << '\n' << usage;
    return 1;
  }

  dupfind::log_t::set_quiet(quiet);

  dupfind::scan_result_t result;
  try {
    dupfind::progress_t progress;
    std::jthread progress_thread;
    if (!quiet) {
      progress_thread = std::jthread(show_progress, std::cref(progress));
    }
    result = dupfind::scan(opt, progress);
  } catch (const dupfind::scan_error &e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }

  const auto &report = result.report;
  if (report.empty()) {
    std::cout << "No duplicate files found\n";
  } else {
    dupfind::print_report(std::cout, report, color);
  }
  if (!result.failures.empty()) {
    std::map<dupfind::stage_t, std::size_t> by_stage;
    for (const auto &failure : result.failures) {
      ++by_stage[failure.stage];
    }
    std::cerr << "[warn] " << result.failures.size()
              << " files could not be read (";
    for (auto it = by_stage.begin(); it != by_stage.end(); ++it) {
      std::cerr << (it == by_stage.begin() ? "" : ", ")
                << dupfind::to_string(it->first) << ": " << it->second;
    }
    std::cerr << ")\n";
  }

  if (output) {
    try {
      dupfind::write_report(*output, report);
      std::cout << "Report saved to " << output->string() << '\n';
    } catch (const dupfind::export_error &e) {
      std::cerr << "[err] " << e.what() << std::endl;
      return 1;
    }
  }

  if (rm_meth && !report.empty()) {
    const auto meth = dry_run ? dupfind::rm_t::log : *rm_meth;
    std::cout << '\n'
              << (dry_run ? "DRY-RUN: " : "")
              << "Deleting duplicates (keeping first occurrence)...\n";
    auto stats = dupfind::remove_dupes(report, meth, std::cout);
    std::cout << '\n'
              << (dry_run ? "DRY-RUN: would delete " : "Deleted ")
              << stats.removed << " files, freed "
              << dupfind::utils::format_size(stats.bytes_freed);
    if (!stats.failures.empty()) {
      std::cout << ", " << stats.failures.size() << " failed";
    }
    std::cout << '\n';
  }
  return 0;
}

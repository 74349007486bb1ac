#include "dupfind/remove.hh"

#include <stdexcept>
#include <string>

#include "dupfind/config.hh"
#include "dupfind/log.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// same inode, a hard link would change nothing
bool already_linked(const fs::path &dup_path,
                    const fs::path &keep_path) noexcept {
  std::error_code ec;
  return fs::equivalent(dup_path, keep_path, ec) && !ec;
}

}  // namespace

rm_t parse_link_kind(std::string_view name) {
  if (name == "hard") {
    return rm_t::hard;
  }
  if (name == "soft" || name == "soft-abs") {
    return rm_t::soft_abs;
  }
  if (name == "soft-rel") {
    return rm_t::soft_rel;
  }
  throw std::invalid_argument("unknown link kind: " + std::string(name) +
                              " (use hard, soft or soft-rel)");
}

std::error_code rm_file(const fs::path &dup_path, const fs::path &keep_path,
                        const rm_t rm_meth) noexcept {
  std::error_code ec;
  switch (rm_meth) {
    case rm_t::log:
      break;
    case rm_t::remove:
      if (!fs::remove(dup_path, ec) && !ec) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
      }
      break;
    case rm_t::soft_rel:
    case rm_t::soft_abs:
    case rm_t::hard: {
      if (!fs::is_regular_file(fs::symlink_status(dup_path, ec))) {
        if (!ec) {
          ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        break;
      }
      if (rm_meth == rm_t::hard && already_linked(dup_path, keep_path)) {
        break;
      }
      auto tmp_path = dup_path;
      tmp_path += ".dupfind-tmp";
      if (rm_meth == rm_t::hard) {
        fs::create_hard_link(keep_path, tmp_path, ec);
      } else if (rm_meth == rm_t::soft_abs) {
        auto target = fs::absolute(keep_path, ec);
        if (!ec) {
          fs::create_symlink(target, tmp_path, ec);
        }
      } else {
        auto target = fs::relative(keep_path, dup_path.parent_path(), ec);
        if (!ec) {
          fs::create_symlink(target, tmp_path, ec);
        }
      }
      if (ec) {
        break;
      }
      fs::rename(tmp_path, dup_path, ec);
      // rename between two names of one inode succeeds and keeps both
      std::error_code rm_ec;
      fs::remove(tmp_path, rm_ec);
    } break;
  }
  return ec;
}

rm_stats_t DUPFIND_EXPORT remove_dupes(const dupe_report_t &report,
                                      const rm_t rm_meth,
                                      std::ostream &out) {
  rm_stats_t stats;
  for (const auto &group : report.groups()) {
    const auto &keep_path = group.files[0].path();
    std::error_code ec;
    if (!fs::exists(keep_path, ec)) {
      // acting now could lose the last copy
      oss(std::cerr) << "[err] kept file missing, skip group: " << keep_path
                     << '\n';
      for (std::size_t i = 1; i < group.files.size(); ++i) {
        stats.failures.push_back(
            {group.files[i].path(), stage_t::remove, "kept file missing"});
      }
      continue;
    }
    for (std::size_t i = 1; i < group.files.size(); ++i) {
      const auto &dup_path = group.files[i].path();
      if (rm_meth == rm_t::hard && already_linked(dup_path, keep_path)) {
        out << "== " << dup_path.string() << " (already linked)\n";
        continue;
      }
      ec = rm_file(dup_path, keep_path, rm_meth);
      if (ec) {
        oss(std::cerr) << "[err] failed to remove: " << dup_path << " - "
                       << ec.message() << '\n';
        stats.failures.push_back({dup_path, stage_t::remove, ec.message()});
        continue;
      }
      out << "<- " << dup_path.string() << "\n-> " << keep_path.string()
          << '\n';
      ++stats.removed;
      stats.bytes_freed += group.size;
    }
  }
  return stats;
}

}  // namespace detail_v1

}  // namespace dupfind

#include "dupfind/walk.hh"

#include <system_error>
#include <vector>

#include "dupfind/log.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

void skip(const fs::path &path, const std::string &msg, failure_vec &failures) {
  oss(std::cerr) << "[warn] skip: " << path << " - " << msg << '\n';
  failures.push_back({path, stage_t::walk, msg});
}

void walk_rec(const fs::path &dir, const filter_opt_t &opt,
              file_entry_vec &file_list, failure_vec &failures) {
  std::vector<fs::path> sub_dirs;
  try {
    for (const auto &dir_entry : fs::directory_iterator(dir)) {
      std::error_code ec;
      const auto &path = dir_entry.path();

      if (dir_entry.is_symlink(ec)) {
        // symlink, never followed
        continue;
      }
      if (ec) {
        skip(path, ec.message(), failures);
        continue;
      }

      const bool is_dir = dir_entry.is_directory(ec);
      if (ec) {
        skip(path, ec.message(), failures);
        continue;
      }
      if (should_skip(path, is_dir, opt.include_hidden) ||
          is_excluded(path, opt.exclude_regex)) {
        continue;
      }

      if (is_dir) {
        // directory, visited after the files of this one
        sub_dirs.push_back(path);

      } else if (dir_entry.is_regular_file(ec) && !ec) {
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          // error read file size, skip
          skip(path, ec.message(), failures);
        } else if (file_size >= opt.min_size &&
                   matches_extensions(path, opt.extensions)) {
          file_list.emplace_back(path, file_size);
        }
      }
      // other file type (fifo, socket, device), skip
    }
  } catch (const fs::filesystem_error &e) {
    // error iterate directory, keep what was listed so far
    skip(dir, e.code().message(), failures);
  }

  for (const auto &sub_dir : sub_dirs) {
    walk_rec(sub_dir, opt, file_list, failures);
  }
}

}  // namespace

file_entry_vec walk(const fs::path &root, const filter_opt_t &opt,
                    failure_vec &failures) {
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    throw scan_error("path does not exist: " + root.string());
  }
  if (!fs::is_directory(root, ec)) {
    throw scan_error("not a directory: " + root.string());
  }
  file_entry_vec file_list;
  walk_rec(root, opt, file_list, failures);
  return file_list;
}

}  // namespace detail_v1

}  // namespace dupfind

#include "dupfind/report.hh"

#include <fstream>
#include <nlohmann/json.hpp>
#include <string_view>

#include "dupfind/parse_size.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace {

using json = nlohmann::json;

constexpr std::size_t short_hash_len = 16;
constexpr std::size_t line_width = 60;

struct palette_t {
  const char *reset = "";
  const char *head = "";
  const char *count = "";
  const char *dim = "";
  const char *keep = "";
  const char *dupe = "";
  const char *waste = "";
};

palette_t make_palette(const bool color) {
  if (!color) {
    return {};
  }
  return {"\x1b[0m",  "\x1b[1m",  "\x1b[1;33m", "\x1b[2m",
          "\x1b[32m", "\x1b[31m", "\x1b[1;31m"};
}

std::string line(std::size_t width) {
  std::string str;
  for (std::size_t i = 0; i < width; ++i) {
    str += "─";
  }
  return str;
}

}  // namespace

void print_report(std::ostream &os, const dupe_report_t &report,
                  const bool color) {
  const auto c = make_palette(color);
  os << '\n'
     << c.head << "DUPLICATE FILES REPORT" << c.reset << "\n\n"
     << "  Duplicate groups: " << report.total_groups() << '\n'
     << "  Total duplicates: " << report.total_duplicates() << '\n'
     << "  Wasted space:     " << c.waste
     << utils::format_size(report.wasted_space()) << c.reset << "\n\n"
     << c.dim << line(line_width) << c.reset << '\n';

  for (const auto &group : report.groups()) {
    os << '\n'
       << "  * " << c.count << group.files.size() << c.reset << " files, "
       << c.dim << utils::format_size(group.size) << " each" << c.reset
       << '\n'
       << "    " << c.dim << "hash: "
       << std::string_view(group.digest).substr(0, short_hash_len) << c.reset
       << '\n';
    for (std::size_t i = 0; i < group.files.size(); ++i) {
      if (i == 0) {
        os << "    " << c.keep << "[keep]" << c.reset << ' ';
      } else {
        os << "    " << c.dupe << "[dupe]" << c.reset << ' ';
      }
      os << group.files[i].path().string() << '\n';
    }
  }
  os << '\n' << c.dim << line(line_width) << c.reset << '\n';
}

std::string report_json(const dupe_report_t &report) {
  json groups = json::array();
  for (const auto &group : report.groups()) {
    json files = json::array();
    for (const auto &file : group.files) {
      files.push_back(file.path().string());
    }
    groups.push_back(
        {{"hash", group.digest}, {"size", group.size}, {"files", files}});
  }
  json doc = {{"total_groups", report.total_groups()},
              {"total_duplicates", report.total_duplicates()},
              {"wasted_space", report.wasted_space()},
              {"groups", groups}};
  // paths are raw bytes, invalid UTF-8 becomes U+FFFD
  return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

void write_report(const std::filesystem::path &path,
                  const dupe_report_t &report) {
  std::string doc;
  try {
    doc = report_json(report);
  } catch (const json::exception &e) {
    throw export_error("cannot serialize report: " + std::string(e.what()));
  }
  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  if (!ofs.is_open()) {
    throw export_error("cannot open report file: " + path.string());
  }
  ofs << doc << '\n';
  ofs.close();
  if (ofs.fail()) {
    throw export_error("cannot write report file: " + path.string());
  }
}

}  // namespace detail_v1

}  // namespace dupfind

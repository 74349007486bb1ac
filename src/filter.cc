#include "dupfind/filter.hh"

#include <algorithm>
#include <cctype>

namespace dupfind {

inline namespace detail_v1 {

namespace {

std::string to_lower(std::string_view str) {
  std::string lower(str);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return lower;
}

std::string_view trim(std::string_view str) noexcept {
  while (!str.empty() && std::isspace((unsigned char)str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && std::isspace((unsigned char)str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

}  // namespace

bool is_noise_dir(std::string_view name) noexcept {
  return std::find(std::begin(noise_dirs), std::end(noise_dirs), name) !=
         std::end(noise_dirs);
}

bool should_skip(const std::filesystem::path &path, const bool is_dir,
                 const bool include_hidden) {
  const auto name = path.filename().string();
  if (!include_hidden && !name.empty() && name[0] == '.') {
    return true;
  }
  return is_dir && is_noise_dir(name);
}

std::vector<std::string> parse_extensions(std::string_view list) {
  std::vector<std::string> extensions;
  while (true) {
    auto pos = list.find(',');
    auto ext = trim(list.substr(0, pos));
    if (!ext.empty() && ext.front() == '.') {
      ext.remove_prefix(1);
    }
    if (!ext.empty()) {
      extensions.emplace_back(to_lower(ext));
    }
    if (pos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(pos + 1);
  }
  return extensions;
}

bool matches_extensions(const std::filesystem::path &path,
                        const std::vector<std::string> &extensions) {
  if (extensions.empty()) {
    return true;
  }
  // ".bashrc" has no extension
  auto ext = path.extension().string();
  if (ext.size() <= 1) {
    return false;
  }
  ext = to_lower(std::string_view(ext).substr(1));
  return std::find(extensions.begin(), extensions.end(), ext) !=
         extensions.end();
}

}  // namespace detail_v1

}  // namespace dupfind

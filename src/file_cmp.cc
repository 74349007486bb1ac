#include "dupfind/file_cmp.hh"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>
#include <vector>

#include "dupfind/config.hh"
#include "dupfind/log.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/bind/bind.hpp>

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace ba = boost::asio;

cmp_t compare_files(const fs::path &lhs, const fs::path &rhs) {
  std::ifstream lhs_ifs(lhs, std::ios::binary);
  if (!lhs_ifs.is_open()) {
    return cmp_t::lhs_error;
  }
  std::ifstream rhs_ifs(rhs, std::ios::binary);
  if (!rhs_ifs.is_open()) {
    return cmp_t::rhs_error;
  }
  std::vector<char> lhs_buf(cmp_blk_sz);
  std::vector<char> rhs_buf(cmp_blk_sz);
  while (true) {
    const auto lhs_len =
        lhs_ifs.read(lhs_buf.data(), (std::streamsize)cmp_blk_sz).gcount();
    const auto rhs_len =
        rhs_ifs.read(rhs_buf.data(), (std::streamsize)cmp_blk_sz).gcount();
    if (lhs_ifs.bad()) {
      return cmp_t::lhs_error;
    }
    if (rhs_ifs.bad()) {
      return cmp_t::rhs_error;
    }
    if (lhs_len != rhs_len ||
        std::memcmp(lhs_buf.data(), rhs_buf.data(), (std::size_t)lhs_len) !=
            0) {
      return cmp_t::differ;
    }
    if (lhs_len < (std::streamsize)cmp_blk_sz) {
      return cmp_t::equal;
    }
  }
}

hash_group_vec verify_group(const hash_group_t &group, failure_vec &failures) {
  struct set_t {
    hash_group_t group;
    // first member became unreadable, no more members join
    bool dead = false;
  };
  std::vector<set_t> sets;

  auto drop = [&failures](const file_entry_t &file) {
    oss(std::cerr) << "[err] verify: cannot read " << file.path() << '\n';
    failures.push_back({file.path(), stage_t::verify, "cannot read"});
  };

  for (const auto &file : group.files) {
    bool placed = false;
    for (auto &set : sets) {
      if (set.dead) {
        continue;
      }
      auto cmp = compare_files(set.group.files[0].path(), file.path());
      if (cmp == cmp_t::equal) {
        set.group.files.push_back(file);
        placed = true;
        break;
      }
      if (cmp == cmp_t::rhs_error) {
        drop(file);
        placed = true;
        break;
      }
      if (cmp == cmp_t::lhs_error) {
        drop(set.group.files[0]);
        set.dead = true;
      }
    }
    if (!placed) {
      sets.push_back({{group.digest, group.size, {file}}, false});
    }
  }

  hash_group_vec verified;
  for (auto &set : sets) {
    if (set.dead) {
      // the rest were already proven equal to each other
      set.group.files.erase(set.group.files.begin());
    }
    if (set.group.files.size() > 1) {
      verified.emplace_back(std::move(set.group));
    }
  }
  if (verified.size() != 1 || verified[0].files.size() != group.files.size()) {
    oss(log_stream()) << "[log] verify split group " << group.digest.substr(0, 16)
                      << " into " << verified.size() << '\n';
  }
  return verified;
}

namespace {

void verify_job(const hash_group_t &group, hash_group_vec &slot,
                failure_vec &failures, std::mutex &mtx) {
  failure_vec local_failures;
  slot = verify_group(group, local_failures);
  if (!local_failures.empty()) {
    std::lock_guard lk(mtx);
    failures.insert(failures.end(),
                    std::make_move_iterator(local_failures.begin()),
                    std::make_move_iterator(local_failures.end()));
  }
}

}  // namespace

hash_group_vec verify_groups(const hash_group_vec &groups,
                             const uint32_t num_thread, failure_vec &failures) {
  std::vector<hash_group_vec> slots(groups.size());
  {
    ba::thread_pool pool(num_thread);
    std::mutex mtx;
    for (auto i = 0UL; i < groups.size(); ++i) {
      ba::post(pool, boost::bind(verify_job, boost::cref(groups[i]),
                                 boost::ref(slots[i]), boost::ref(failures),
                                 boost::ref(mtx)));
    }
    pool.join();
  }
  hash_group_vec verified;
  for (auto &slot : slots) {
    verified.insert(verified.end(), std::make_move_iterator(slot.begin()),
                    std::make_move_iterator(slot.end()));
  }
  return verified;
}

}  // namespace detail_v1

}  // namespace dupfind

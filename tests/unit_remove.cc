// unit_remove.cc - keep-first action policy, partial failures, links

#include "dupfind/dupfind.hh"
#include "dupfind/remove.hh"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace dupfind;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const char* name){
    fs::path p = fs::path("unit_tmp")/name;
    fs::remove_all(p); fs::create_directories(p); return p;
}
static void write_file(const fs::path &p, const std::string &c){ fs::create_directories(p.parent_path()); std::ofstream o(p, std::ios::binary); o<<c; }
static std::string read_file(const fs::path &p){ std::ifstream i(p, std::ios::binary); return std::string((std::istreambuf_iterator<char>(i)),{}); }

static scan_result_t scan_dir(const fs::path &root){
    scan_opt_t opt; opt.root = root; opt.num_thread = 2;
    progress_t progress;
    return scan(opt, progress);
}

static void test_delete_scenario(){
    auto d = make_temp_dir("rm_abc");
    write_file(d/"a.txt","0123456789");
    write_file(d/"sub"/"b.txt","0123456789");
    write_file(d/"c.txt","01234567890123456789");
    auto result = scan_dir(d);
    std::ostringstream out;
    auto stats = remove_dupes(result.report, rm_t::remove, out);
    assert(stats.removed==1);
    assert(stats.bytes_freed==10);
    assert(stats.failures.empty());
    assert(fs::exists(d/"a.txt"));
    assert(!fs::exists(d/"sub"/"b.txt"));
    assert(fs::exists(d/"c.txt"));
    assert(out.str().find("b.txt")!=std::string::npos);
    // nothing left to find
    assert(scan_dir(d).report.empty());
}

static void test_dry_run(){
    auto d = make_temp_dir("rm_dry");
    write_file(d/"a.txt","copy");
    write_file(d/"x"/"b.txt","copy");
    write_file(d/"y"/"c.txt","copy");
    auto result = scan_dir(d);
    std::ostringstream out;
    auto stats = remove_dupes(result.report, rm_t::log, out);
    assert(stats.removed==2 && stats.bytes_freed==8);
    assert(fs::exists(d/"x"/"b.txt") && fs::exists(d/"y"/"c.txt"));
}

static void test_failure_does_not_stop_pass(){
    auto d = make_temp_dir("rm_partial");
    write_file(d/"a.txt","same!");
    write_file(d/"x"/"b.txt","same!");
    write_file(d/"y"/"c.txt","same!");
    write_file(d/"p.txt","other");
    write_file(d/"z"/"q.txt","other");
    auto result = scan_dir(d);
    assert(result.report.total_groups()==2);
    // b.txt vanishes after the scan
    fs::remove(d/"x"/"b.txt");
    std::ostringstream out;
    auto stats = remove_dupes(result.report, rm_t::remove, out);
    assert(stats.failures.size()==1);
    assert(stats.failures[0].path==d/"x"/"b.txt" && stats.failures[0].stage==stage_t::remove);
    assert(stats.removed==2 && stats.bytes_freed==10);
    assert(fs::exists(d/"a.txt") && !fs::exists(d/"y"/"c.txt"));
    assert(fs::exists(d/"p.txt") && !fs::exists(d/"z"/"q.txt"));
}

static void test_missing_keep_skips_group(){
    auto d = make_temp_dir("rm_keep_gone");
    write_file(d/"a.txt","data");
    write_file(d/"x"/"b.txt","data");
    auto result = scan_dir(d);
    fs::remove(d/"a.txt");
    std::ostringstream out;
    auto stats = remove_dupes(result.report, rm_t::remove, out);
    assert(stats.removed==0 && stats.failures.size()==1);
    assert(fs::exists(d/"x"/"b.txt")); // last copy survives
}

static void test_link_replacement(){
    auto d = make_temp_dir("rm_link");
    write_file(d/"a.txt","linked");
    write_file(d/"h"/"b.txt","linked");
    write_file(d/"s"/"c.txt","linked");
    write_file(d/"r"/"e.txt","linked");
    auto keep = d/"a.txt";
    assert(!rm_file(d/"h"/"b.txt", keep, rm_t::hard));
    assert(fs::equivalent(d/"h"/"b.txt", keep));
    assert(!rm_file(d/"s"/"c.txt", keep, rm_t::soft_abs));
    assert(fs::is_symlink(d/"s"/"c.txt") && fs::read_symlink(d/"s"/"c.txt").is_absolute());
    assert(read_file(d/"s"/"c.txt")=="linked");
    assert(!rm_file(d/"r"/"e.txt", keep, rm_t::soft_rel));
    assert(fs::is_symlink(d/"r"/"e.txt") && fs::read_symlink(d/"r"/"e.txt").is_relative());
    assert(read_file(d/"r"/"e.txt")=="linked");
    // missing duplicate: error, nothing created
    assert(rm_file(d/"none.txt", keep, rm_t::hard));
    assert(!fs::exists(d/"none.txt"));
}

static void test_hard_link_rerun(){
    auto d = make_temp_dir("rm_relink");
    write_file(d/"a.txt","twice");
    fs::create_directories(d/"x");
    fs::create_hard_link(d/"a.txt", d/"x"/"b.txt");
    auto result = scan_dir(d);
    assert(result.report.total_groups()==1);
    std::ostringstream out;
    auto stats = remove_dupes(result.report, rm_t::hard, out);
    assert(stats.removed==0 && stats.bytes_freed==0 && stats.failures.empty());
    assert(out.str().find("already linked")!=std::string::npos);
    assert(fs::equivalent(d/"x"/"b.txt", d/"a.txt"));
    assert(!fs::exists(d/"x"/"b.txt.dupfind-tmp"));
    // direct call is a no-op too
    assert(!rm_file(d/"x"/"b.txt", d/"a.txt", rm_t::hard));
    assert(!fs::exists(d/"x"/"b.txt.dupfind-tmp"));
    size_t entries = 0;
    for(auto &e : fs::directory_iterator(d/"x")){ (void)e; ++entries; }
    assert(entries==1);
}

static void test_parse_link_kind(){
    assert(parse_link_kind("hard")==rm_t::hard);
    assert(parse_link_kind("soft")==rm_t::soft_abs);
    assert(parse_link_kind("soft-rel")==rm_t::soft_rel);
    bool thrown = false;
    try { parse_link_kind("copy"); } catch(const std::invalid_argument &) { thrown = true; }
    assert(thrown);
}

int main(){
    test_delete_scenario();
    test_dry_run();
    test_failure_does_not_stop_pass();
    test_missing_keep_skips_group();
    test_link_replacement();
    test_hard_link_rerun();
    test_parse_link_kind();
    std::cout << "All remove tests passed" << std::endl;
    return 0;
}

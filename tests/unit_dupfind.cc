// unit_dupfind.cc - whole scan: grouping, accounting, keep order, verify

#include "dupfind/dupfind.hh"
#include "dupfind/file_cmp.hh"
#include "dupfind/grouper.hh"
#include "dupfind/walk.hh"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <set>

using namespace dupfind;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string &name){
    fs::path p = fs::path("unit_tmp")/name;
    fs::remove_all(p); fs::create_directories(p); return p;
}
static void write_file(const fs::path &p, std::string_view data){ fs::create_directories(p.parent_path()); std::ofstream o(p, std::ios::binary); o<<data; }

static std::string random_data(size_t n, uint64_t seed){
    std::mt19937_64 rng(seed);
    std::string data; data.resize(n);
    for(char &c: data) c = static_cast<char>(rng() & 0xFF);
    return data;
}

static scan_opt_t options(const fs::path &root){
    scan_opt_t opt; opt.root = root; opt.num_thread = 4; return opt;
}

// group membership as comparable sets, order of groups ignored
static std::set<std::set<std::string>> membership(const dupe_report_t &report){
    std::set<std::set<std::string>> sets;
    for(auto &group : report.groups()){
        std::set<std::string> s;
        for(auto &f : group.files) s.insert(f.path().string());
        sets.insert(s);
    }
    return sets;
}

static void test_three_file_scenario(){
    auto d = make_temp_dir("scan_abc");
    write_file(d/"a.txt","0123456789");
    write_file(d/"sub"/"b.txt","0123456789");
    write_file(d/"c.txt","01234567890123456789");
    progress_t progress;
    auto result = scan(options(d), progress);
    auto &report = result.report;
    assert(report.total_groups()==1);
    assert(report.total_duplicates()==1);
    assert(report.wasted_space()==10);
    auto &group = report.groups()[0];
    assert(group.size==10);
    assert(group.files.size()==2);
    assert(group.files[0].path()==d/"a.txt");          // discovered first
    assert(group.files[1].path()==d/"sub"/"b.txt");
    assert(group.digest==hash_file(d/"a.txt", hash_algo_t::sha256));
    // c.txt has a unique size and is never hashed
    assert(result.stats.files_indexed==3);
    assert(result.stats.candidates==2);
    assert(progress.total==2 && progress.done==2);
    assert(result.failures.empty());
}

static void test_noise_dir_never_grouped(){
    auto d = make_temp_dir("scan_noise");
    write_file(d/"lib.js","module.exports = 1;");
    write_file(d/"node_modules"/"dep"/"lib.js","module.exports = 1;");
    write_file(d/".git"/"objects"/"lib.js","module.exports = 1;");
    progress_t progress;
    auto result = scan(options(d), progress);
    assert(result.report.empty());
    assert(result.stats.files_indexed==1);
    assert(progress.total==0);
}

static void test_accounting_and_grouping(){
    auto d = make_temp_dir("scan_many");
    auto big = random_data(20000, 11);
    auto big_other = random_data(20000, 12);
    // three copies of big, two of big_other: same size, two groups
    write_file(d/"big1.bin", big);
    write_file(d/"x"/"big2.bin", big);
    write_file(d/"y"/"big3.bin", big);
    write_file(d/"other1.bin", big_other);
    write_file(d/"y"/"other2.bin", big_other);
    // same size as small pair but different content
    write_file(d/"s1.txt","hello world");
    write_file(d/"s2.txt","hello world");
    write_file(d/"s3.txt","HELLO WORLD");
    write_file(d/"unique.txt","just me");
    progress_t progress;
    auto result = scan(options(d), progress);
    auto &report = result.report;
    assert(report.total_groups()==3);
    assert(report.total_duplicates()==2 + 1 + 1);
    uint64_t wasted = 0;
    for(auto &group : report.groups()){
        wasted += group.size * (group.files.size() - 1);
        // every member has the group's size and digest
        for(auto &f : group.files){
            assert(f.size()==group.size);
            assert(hash_file(f.path(), hash_algo_t::sha256)==group.digest);
        }
    }
    assert(report.wasted_space()==wasted);
    assert(wasted==2*20000ULL + 20000 + 11);
    auto sets = membership(report);
    assert(sets.count({(d/"big1.bin").string(), (d/"x"/"big2.bin").string(), (d/"y"/"big3.bin").string()})==1);
    assert(sets.count({(d/"other1.bin").string(), (d/"y"/"other2.bin").string()})==1);
    assert(sets.count({(d/"s1.txt").string(), (d/"s2.txt").string()})==1);

    // keep is the first discovered member of its group
    failure_vec failures;
    auto order = walk(d, filter_opt_t{}, failures);
    for(auto &group : report.groups()){
        auto first = std::find_if(order.begin(), order.end(), [&](const auto &f){
            return std::any_of(group.files.begin(), group.files.end(), [&](const auto &g){ return g.path()==f.path(); });
        });
        assert(first!=order.end() && first->path()==group.files[0].path());
    }

    // unchanged tree: same membership and totals
    progress_t again_progress;
    auto again = scan(options(d), again_progress);
    assert(membership(again.report)==sets);
    assert(again.report.total_duplicates()==report.total_duplicates());
    assert(again.report.wasted_space()==report.wasted_space());

    // prefilter off and other algorithms: same answer
    auto no_pre = options(d); no_pre.prefilter = false; no_pre.algo = hash_algo_t::md5;
    progress_t p2;
    auto plain = scan(no_pre, p2);
    assert(membership(plain.report)==sets);
    assert(plain.stats.prefiltered==0);
    auto sha512 = options(d); sha512.algo = hash_algo_t::sha512; sha512.verify = true;
    progress_t p3;
    auto verified = scan(sha512, p3);
    assert(membership(verified.report)==sets);
    assert(verified.report.groups()[0].digest.size()==128);
}

static void test_prefilter_skips_full_hash(){
    auto d = make_temp_dir("scan_prefilter");
    write_file(d/"a.bin", random_data(10000, 1));
    write_file(d/"b.bin", random_data(10000, 2));
    write_file(d/"c.bin", random_data(10000, 3));
    progress_t progress;
    auto result = scan(options(d), progress);
    assert(result.report.empty());
    assert(result.stats.candidates==3);
    assert(result.stats.prefiltered==3);
    assert(progress.total==0);
}

static void test_min_size_and_extensions(){
    auto d = make_temp_dir("scan_filter");
    write_file(d/"a.jpg","pixels");
    write_file(d/"b.JPG","pixels");
    write_file(d/"c.png","pixels");
    write_file(d/"t1.txt","xy");
    write_file(d/"t2.txt","xy");
    auto opt = options(d);
    opt.filter.extensions = parse_extensions("jpg");
    progress_t p1;
    auto r1 = scan(opt, p1);
    assert(r1.report.total_groups()==1);
    assert(r1.report.groups()[0].files.size()==2);

    auto big = options(d); big.filter.min_size = 3;
    progress_t p2;
    auto r2 = scan(big, p2);
    assert(r2.report.total_groups()==1);
    assert(r2.report.groups()[0].files.size()==3); // a.jpg b.JPG c.png
}

static void test_sort_paths(){
    auto d = make_temp_dir("scan_sorted");
    write_file(d/"zz"/"copy.txt","same content");
    write_file(d/"aa"/"copy.txt","same content");
    write_file(d/"mm.txt","same content");
    auto opt = options(d); opt.sort_paths = true;
    progress_t progress;
    auto result = scan(opt, progress);
    auto &files = result.report.groups()[0].files;
    assert(files.size()==3);
    assert(files[0].path()==d/"aa"/"copy.txt");
    assert(files[1].path()==d/"mm.txt");
    assert(files[2].path()==d/"zz"/"copy.txt");
}

static void test_group_by_digest(){
    hashed_bucket_vec hashed(2);
    hashed[0].bucket = {5, {{"p/1", 5}, {"p/2", 5}, {"p/3", 5}, {"p/4", 5}, {"p/5", 5}}};
    hashed[0].digests = {"bb", "aa", std::nullopt, "bb", "aa"};
    hashed[1].bucket = {3, {{"q/1", 3}, {"q/2", 3}}};
    hashed[1].digests = {"aa", "cc"};
    auto groups = group_by_digest(hashed);
    assert(groups.size()==2);
    assert(groups[0].digest=="bb" && groups[0].files.size()==2);
    assert(groups[0].files[0].path()=="p/1" && groups[0].files[1].path()=="p/4");
    assert(groups[1].digest=="aa" && groups[1].files[0].path()=="p/2");
    // equal digests in different buckets never meet
    for(auto &g : groups) assert(g.size==5);

    dupe_report_t report(groups);
    assert(report.total_groups()==2 && report.total_duplicates()==2 && report.wasted_space()==10);
    hash_group_vec single{{"zz", 7, {{"r/1", 7}}}};
    dupe_report_t with_single(single);
    assert(with_single.empty() && with_single.wasted_space()==0);
}

static void test_verify_splits_collision(){
    auto d = make_temp_dir("scan_verify");
    write_file(d/"a.txt","AAAA");
    write_file(d/"b.txt","BBBB");
    write_file(d/"c.txt","AAAA");
    write_file(d/"e.txt","BBBB");
    // pretend all four collided on one digest
    hash_group_t forged{"deadbeef", 4, {{d/"a.txt", 4}, {d/"b.txt", 4}, {d/"c.txt", 4}, {d/"e.txt", 4}, {d/"gone.txt", 4}}};
    failure_vec failures;
    auto verified = verify_groups({forged}, 2, failures);
    assert(verified.size()==2);
    assert(verified[0].files.size()==2 && verified[0].files[0].path()==d/"a.txt" && verified[0].files[1].path()==d/"c.txt");
    assert(verified[1].files.size()==2 && verified[1].files[0].path()==d/"b.txt" && verified[1].files[1].path()==d/"e.txt");
    assert(failures.size()==1 && failures[0].path==d/"gone.txt" && failures[0].stage==stage_t::verify);
    assert(compare_files(d/"a.txt", d/"c.txt")==cmp_t::equal);
    assert(compare_files(d/"a.txt", d/"b.txt")==cmp_t::differ);
    assert(compare_files(d/"gone.txt", d/"a.txt")==cmp_t::lhs_error);
}

static void test_bad_root(){
    progress_t progress;
    bool thrown = false;
    try { scan(options("unit_tmp/does_not_exist"), progress); } catch(const scan_error &) { thrown = true; }
    assert(thrown);
}

int main(){
    test_three_file_scenario();
    test_noise_dir_never_grouped();
    test_accounting_and_grouping();
    test_prefilter_skips_full_hash();
    test_min_size_and_extensions();
    test_sort_paths();
    test_group_by_digest();
    test_verify_splits_collision();
    test_bad_root();
    std::cout << "All dupfind tests passed" << std::endl;
    return 0;
}

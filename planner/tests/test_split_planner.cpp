#include "worksplit/errors.hpp"
#include "worksplit/logging.hpp"
#include "worksplit/split_planner.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

struct FakeFile {
    std::uint64_t length;
    std::vector<worksplit::BlockLocation> blocks;
};

// In-memory storage; unknown references resolve to an empty container.
class FakeStorage : public worksplit::DescriptorResolver, public worksplit::BlockLocator {
  public:
    void add_root(const std::string &root, std::vector<std::string> files) { roots_[root] = std::move(files); }

    void add_reference(const std::string &ref, worksplit::DescriptorFile file) {
        references_.emplace(ref, std::move(file));
    }

    void add_file(const std::string &path, FakeFile file) { files_[path] = std::move(file); }

    void fail_on(const std::string &ref) { missing_.insert(ref); }

    std::vector<std::string> list(const std::string &root) override {
        auto it = roots_.find(root);
        if (it == roots_.end()) {
            throw worksplit::NotFoundError("path " + root + " does not exist");
        }
        return it->second;
    }

    worksplit::DescriptorFile load(const std::string &ref) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (missing_.count(ref) != 0) {
            throw worksplit::NotFoundError(ref);
        }
        auto it = references_.find(ref);
        if (it == references_.end()) {
            return worksplit::DescriptorContainer{};
        }
        return it->second;
    }

    std::uint64_t file_length(const std::string &path) override { return files_.at(path).length; }

    std::vector<worksplit::BlockLocation> block_locations(const std::string &path, std::uint64_t,
                                                          std::uint64_t) override {
        return files_.at(path).blocks;
    }

  private:
    std::map<std::string, std::vector<std::string>> roots_;
    std::map<std::string, worksplit::DescriptorFile> references_;
    std::map<std::string, FakeFile> files_;
    std::set<std::string> missing_;
    std::mutex mutex_;
};

worksplit::DescriptorFile single(const std::string &path) {
    worksplit::WorkDescriptor descriptor;
    descriptor.source_file_path = path;
    return worksplit::SingleDescriptor{descriptor};
}

std::vector<std::string> references(std::size_t count) {
    std::vector<std::string> refs;
    for (std::size_t i = 0; i < count; ++i) {
        refs.push_back("/jobs/wu-" + std::to_string(i) + ".wu");
    }
    return refs;
}

template <typename Error, typename Fn> bool throws(Fn &&fn) {
    try {
        fn();
    } catch (const Error &) {
        return true;
    }
    return false;
}

void test_empty_input_is_rejected() {
    FakeStorage storage;
    worksplit::SplitPlanner planner(storage, storage);
    assert(throws<worksplit::NoInputError>([&] { planner.plan({}, 4); }));
    assert(throws<worksplit::NoInputError>([&] { planner.plan_inputs({}, 4); }));
}

void test_group_size() {
    using worksplit::SplitPlanner;
    assert(SplitPlanner::group_size(10, 3) == 4);
    assert(SplitPlanner::group_size(9, 3) == 3);
    assert(SplitPlanner::group_size(10, 0) == 10);
    assert(SplitPlanner::group_size(10, -5) == 10);
    assert(SplitPlanner::group_size(5, 5) == 1);
    assert(SplitPlanner::group_size(3, std::numeric_limits<int>::max()) == 1);
}

void test_groups_partition_input_in_order() {
    FakeStorage storage;
    worksplit::SplitPlanner planner(storage, storage);
    for (std::size_t count = 1; count <= 20; ++count) {
        auto refs = references(count);
        for (int workers = -1; workers <= 25; ++workers) {
            auto splits = planner.plan(refs, workers);
            const auto bound = static_cast<std::size_t>(workers < 1 ? 1 : workers);
            assert(!splits.empty());
            assert(splits.size() <= bound);

            std::vector<std::string> joined;
            for (const auto &split : splits) {
                assert(!split.paths().empty());
                if (bound >= count) {
                    assert(split.paths().size() == 1);
                }
                joined.insert(joined.end(), split.paths().begin(), split.paths().end());
            }
            assert(joined == refs);
        }
    }
}

void test_unbounded_workers_give_one_split_per_reference() {
    FakeStorage storage;
    worksplit::SplitPlanner planner(storage, storage);
    auto refs = references(7);
    auto splits = planner.plan(refs);
    assert(splits.size() == refs.size());
    for (std::size_t i = 0; i < refs.size(); ++i) {
        assert((splits[i].paths() == std::vector<std::string>{refs[i]}));
    }
}

void test_hosts_are_unioned_per_reference() {
    FakeStorage storage;
    // a=300 b=300 c=200 d=100 x=100 on its own: top hosts a, b, c.
    storage.add_file("/data/f1", {400,
                                  {{{"a", "b", "c"}, 0, 100},
                                   {{"a", "b", "c"}, 100, 100},
                                   {{"a", "b", "d"}, 200, 100},
                                   {{"x"}, 300, 100}}});
    // Would be cut from a pooled ranking but tops its own reference.
    storage.add_file("/data/f2", {50, {{{"e"}, 0, 50}}});
    storage.add_file("/data/f3", {100, {{{"c", "a"}, 0, 100}}});
    storage.add_reference("/jobs/r1.wu", single("/data/f1"));
    storage.add_reference("/jobs/r2.wu", single("/data/f2"));
    storage.add_reference("/jobs/r3.wu", single("/data/f3"));

    worksplit::SplitPlanner planner(storage, storage);
    auto splits = planner.plan({"/jobs/r1.wu", "/jobs/r2.wu", "/jobs/r3.wu"}, 1);
    assert(splits.size() == 1);
    assert((splits[0].preferred_hosts() == std::vector<std::string>{"a", "b", "c", "e"}));
    assert((splits[0].locations() == splits[0].preferred_hosts()));
}

void test_container_references_are_flattened() {
    FakeStorage storage;
    storage.add_file("/data/f1", {100, {{{"h1"}, 0, 100}}});
    storage.add_file("/data/f2", {100, {{{"h2"}, 0, 100}}});
    worksplit::WorkDescriptor first;
    first.source_file_path = "/data/f1";
    worksplit::WorkDescriptor second;
    second.source_file_path = "/data/f2";
    storage.add_reference("/jobs/multi.mwu", worksplit::DescriptorContainer{{first, second}});

    worksplit::SplitPlanner planner(storage, storage);
    auto splits = planner.plan({"/jobs/multi.mwu"}, 3);
    assert(splits.size() == 1);
    assert((splits[0].preferred_hosts() == std::vector<std::string>{"h1", "h2"}));
}

void test_missing_reference_aborts_planning() {
    FakeStorage storage;
    storage.fail_on("/jobs/wu-3.wu");
    worksplit::SplitPlanner planner(storage, storage);
    assert(throws<worksplit::NotFoundError>([&] { planner.plan(references(6), 2); }));
}

void test_concurrent_planning_matches_sequential() {
    FakeStorage storage;
    auto refs = references(40);
    for (std::size_t i = 0; i < refs.size(); ++i) {
        const auto path = "/data/f" + std::to_string(i);
        storage.add_file(path, {100,
                                {{{"h" + std::to_string(i % 5), "h" + std::to_string((i + 1) % 5)}, 0, 60},
                                 {{"h" + std::to_string((i + 2) % 5)}, 60, 40}}});
        storage.add_reference(refs[i], single(path));
    }

    worksplit::SplitPlanner sequential(storage, storage);
    worksplit::SplitPlanner concurrent(storage, storage, 4);
    assert(concurrent.concurrency() == 4);

    auto expected = sequential.plan(refs, 7);
    auto actual = concurrent.plan(refs, 7);
    assert(expected.size() == 7);
    assert(actual.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        assert(actual[i] == expected[i]);
        assert(actual[i].preferred_hosts() == expected[i].preferred_hosts());
    }
}

void test_concurrent_failure_aborts_planning() {
    FakeStorage storage;
    storage.fail_on("/jobs/wu-17.wu");
    worksplit::SplitPlanner planner(storage, storage, 3);
    assert(throws<worksplit::NotFoundError>([&] { planner.plan(references(30), 4); }));
}

void test_plan_inputs_lists_roots() {
    std::ostringstream log;
    worksplit::Logger::instance().set_sink(log);

    FakeStorage storage;
    storage.add_root("/jobs/a", {"/jobs/a/1.wu", "/jobs/a/2.wu"});
    storage.add_root("/jobs/b.wu", {"/jobs/b.wu"});
    storage.add_root("/jobs/empty", {});
    worksplit::SplitPlanner planner(storage, storage);

    auto splits = planner.plan_inputs({"/jobs/a", "/jobs/b.wu"}, 2);
    assert(splits.size() == 2);
    assert((splits[0].paths() == std::vector<std::string>{"/jobs/a/1.wu", "/jobs/a/2.wu"}));
    assert((splits[1].paths() == std::vector<std::string>{"/jobs/b.wu"}));
    assert(log.str().find("Found 2 input files at /jobs/a") != std::string::npos);

    assert(throws<worksplit::NotFoundError>([&] { planner.plan_inputs({"/jobs/missing"}, 2); }));
    assert(throws<worksplit::NoInputError>([&] { planner.plan_inputs({"/jobs/empty"}, 2); }));

    worksplit::Logger::instance().reset_sink();
}

void test_zero_concurrency_is_rejected() {
    FakeStorage storage;
    assert(throws<std::invalid_argument>([&] { worksplit::SplitPlanner planner(storage, storage, 0); }));
}

} // namespace

int main() {
    test_empty_input_is_rejected();
    test_group_size();
    test_groups_partition_input_in_order();
    test_unbounded_workers_give_one_split_per_reference();
    test_hosts_are_unioned_per_reference();
    test_container_references_are_flattened();
    test_missing_reference_aborts_planning();
    test_concurrent_planning_matches_sequential();
    test_concurrent_failure_aborts_planning();
    test_plan_inputs_lists_roots();
    test_zero_concurrency_is_rejected();
    return 0;
}

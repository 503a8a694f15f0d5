#include "worksplit/errors.hpp"
#include "worksplit/planner_config.hpp"
#include "worksplit/properties.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

template <typename Error, typename Fn> bool throws(Fn &&fn) {
    try {
        fn();
    } catch (const Error &) {
        return true;
    }
    return false;
}

void test_parse_properties() {
    std::istringstream in("# planner settings\n"
                          "\n"
                          "  worksplit.max.workers = 12  \n"
                          "worksplit.planner.threads=4\n"
                          "empty.value=\n");
    auto properties = worksplit::parse_properties(in);
    assert(properties.size() == 3);
    assert(properties.at("worksplit.max.workers") == "12");
    assert(properties.at("worksplit.planner.threads") == "4");
    assert(properties.at("empty.value").empty());

    std::istringstream missing_eq("worksplit.max.workers 12\n");
    assert(throws<worksplit::ConfigError>([&] { worksplit::parse_properties(missing_eq); }));
    std::istringstream empty_key("=12\n");
    assert(throws<worksplit::ConfigError>([&] { worksplit::parse_properties(empty_key); }));
}

void test_integer_parsing() {
    assert(worksplit::parse_int("k", "-3") == -3);
    assert(worksplit::parse_uint("k", "18446744073709551615") == 18446744073709551615ull);
    assert(throws<worksplit::ConfigError>([] { worksplit::parse_int("k", "12x"); }));
    assert(throws<worksplit::ConfigError>([] { worksplit::parse_int("k", ""); }));
    assert(throws<worksplit::ConfigError>([] { worksplit::parse_uint("k", "-1"); }));
    assert(throws<worksplit::ConfigError>([] { worksplit::parse_uint("k", "99999999999999999999"); }));
}

void test_defaults() {
    auto config = worksplit::PlannerConfig::from_properties({});
    assert(config.max_workers == worksplit::kUnboundedWorkers);
    assert(config.concurrency == 1);
}

void test_from_properties() {
    auto config = worksplit::PlannerConfig::from_properties(
        {{worksplit::PlannerConfig::kMaxWorkersKey, "8"}, {worksplit::PlannerConfig::kThreadsKey, "3"}});
    assert(config.max_workers == 8);
    assert(config.concurrency == 3);

    auto non_positive = worksplit::PlannerConfig::from_properties({{"worksplit.max.workers", "0"}});
    assert(non_positive.max_workers == 0);

    assert(throws<worksplit::ConfigError>(
        [] { worksplit::PlannerConfig::from_properties({{"worksplit.max.workers", "many"}}); }));
    assert(throws<worksplit::ConfigError>(
        [] { worksplit::PlannerConfig::from_properties({{"worksplit.max.workers", "4294967296"}}); }));
    assert(throws<worksplit::ConfigError>(
        [] { worksplit::PlannerConfig::from_properties({{"worksplit.planner.threads", "0"}}); }));
}

void test_load_properties() {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "worksplit_planner_config_test.properties";
    {
        std::ofstream file(path);
        file << "worksplit.max.workers=5\n";
    }
    auto config = worksplit::PlannerConfig::from_properties(worksplit::load_properties(path));
    assert(config.max_workers == 5);
    fs::remove(path);
    assert(throws<worksplit::NotFoundError>([&] { worksplit::load_properties(path); }));
}

} // namespace

int main() {
    test_parse_properties();
    test_integer_parsing();
    test_defaults();
    test_from_properties();
    test_load_properties();
    return 0;
}

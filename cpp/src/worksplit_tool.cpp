#include "worksplit/errors.hpp"
#include "worksplit/local_storage.hpp"
#include "worksplit/logging.hpp"
#include "worksplit/planner_config.hpp"
#include "worksplit/properties.hpp"
#include "worksplit/sequential_reader.hpp"
#include "worksplit/split_codec.hpp"
#include "worksplit/split_planner.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

using worksplit::ConfigError;

struct PlanOptions {
    std::vector<std::string> inputs;
    std::filesystem::path output_dir;
    std::optional<std::filesystem::path> config_file;
    std::optional<int> max_workers;
    std::optional<std::size_t> threads;
    std::uint64_t block_size = worksplit::LocalStorage::kDefaultBlockSize;
    std::vector<std::string> hosts;
    std::size_t replication = 1;
    bool verbose = false;
};

struct ReadOptions {
    std::filesystem::path split_file;
};

std::vector<std::string> split_list(const std::string &text) {
    std::vector<std::string> items;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = worksplit::trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::size_t positive(const std::string &option, const std::string &value) {
    auto parsed = worksplit::parse_uint(option, value);
    if (parsed == 0) {
        throw ConfigError(option + " must be > 0");
    }
    return static_cast<std::size_t>(parsed);
}

std::string join(const std::vector<std::string> &items) {
    std::string joined;
    for (const auto &item : items) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += item;
    }
    return joined;
}

std::string split_file_name(std::size_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "split-%05zu.bin", index);
    return name;
}

void print_usage() {
    std::cerr << "Usage:\n"
                 "  worksplit_tool plan --input <path> [--input <path>]... --output-dir <dir>\n"
                 "                      [--max-workers <n>] [--threads <n>] [--block-size <bytes>]\n"
                 "                      [--hosts <h1,h2,...>] [--replication <n>] [--config <file>]\n"
                 "                      [--verbose]\n"
                 "  worksplit_tool read --split <file>\n";
}

PlanOptions parse_plan(int argc, char **argv) {
    PlanOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            opts.inputs.push_back(argv[++i]);
        } else if (arg == "--output-dir" && i + 1 < argc) {
            opts.output_dir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_file = std::filesystem::path(argv[++i]);
        } else if (arg == "--max-workers" && i + 1 < argc) {
            auto value = worksplit::parse_int(arg, argv[++i]);
            if (value > worksplit::kUnboundedWorkers || value < -worksplit::kUnboundedWorkers) {
                throw ConfigError("--max-workers out of range");
            }
            opts.max_workers = static_cast<int>(value);
        } else if (arg == "--threads" && i + 1 < argc) {
            opts.threads = positive(arg, argv[++i]);
        } else if (arg == "--block-size" && i + 1 < argc) {
            opts.block_size = positive(arg, argv[++i]);
        } else if (arg == "--hosts" && i + 1 < argc) {
            opts.hosts = split_list(argv[++i]);
        } else if (arg == "--replication" && i + 1 < argc) {
            opts.replication = positive(arg, argv[++i]);
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ConfigError("unknown or incomplete option: " + arg);
        }
    }
    if (opts.inputs.empty() || opts.output_dir.empty()) {
        throw ConfigError("missing required plan options");
    }
    return opts;
}

ReadOptions parse_read(int argc, char **argv) {
    ReadOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--split" && i + 1 < argc) {
            opts.split_file = argv[++i];
        } else {
            throw ConfigError("unknown or incomplete option: " + arg);
        }
    }
    if (opts.split_file.empty()) {
        throw ConfigError("missing --split option");
    }
    return opts;
}

void run_plan(const PlanOptions &opts) {
    if (opts.verbose) {
        worksplit::Logger::instance().set_min_level(worksplit::LogLevel::Debug);
    }

    worksplit::PlannerConfig config;
    if (opts.config_file) {
        config = worksplit::PlannerConfig::from_properties(worksplit::load_properties(*opts.config_file));
    }
    if (opts.max_workers) {
        config.max_workers = *opts.max_workers;
    }
    if (opts.threads) {
        config.concurrency = *opts.threads;
    }

    worksplit::LocalStorage storage(opts.block_size, opts.hosts, opts.replication);
    worksplit::SplitPlanner planner(storage, storage, config.concurrency);
    auto splits = planner.plan_inputs(opts.inputs, config.max_workers);

    std::error_code ec;
    std::filesystem::create_directories(opts.output_dir, ec);
    if (ec) {
        throw worksplit::StorageError("failed to create " + opts.output_dir.string() + ": " + ec.message());
    }
    for (std::size_t i = 0; i < splits.size(); ++i) {
        auto name = split_file_name(i);
        worksplit::write_split_file(opts.output_dir / name, splits[i]);
        std::cout << name << " paths=" << splits[i].paths().size()
                  << " hosts=" << join(splits[i].preferred_hosts()) << std::endl;
    }
}

void run_read(const ReadOptions &opts) {
    worksplit::SequentialReader reader(worksplit::read_split_file(opts.split_file));
    std::cout << "hosts\t" << join(reader.preferred_hosts()) << '\n';
    while (reader.advance()) {
        auto entry = reader.current();
        std::cout << entry.index << '\t' << entry.path << '\n';
    }
    reader.close();
    std::cout.flush();
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "plan") {
            run_plan(parse_plan(argc - 2, argv + 2));
        } else if (mode == "read") {
            run_read(parse_read(argc - 2, argv + 2));
        } else if (mode == "--help" || mode == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            throw ConfigError("unknown mode: " + mode);
        }
    } catch (const worksplit::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

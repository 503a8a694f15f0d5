#include "worksplit/split_planner.hpp"

#include "worksplit/errors.hpp"
#include "worksplit/logging.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <iterator>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

namespace worksplit {

namespace {

// Runs an indexed task on a fixed set of threads. The first failure stops the
// remaining queued work and is rethrown by wait_for_completion().
class HostResolutionPool {
  public:
    HostResolutionPool(std::size_t concurrency, std::function<void(std::size_t)> task)
        : task_(std::move(task)) {
        threads_.reserve(concurrency);
        try {
            for (std::size_t i = 0; i < concurrency; ++i) {
                threads_.emplace_back(&HostResolutionPool::worker_thread, this);
            }
        } catch (...) {
            join_all();
            throw;
        }
    }

    ~HostResolutionPool() { join_all(); }

    void submit(std::size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push(index);
        }
        cv_.notify_one();
    }

    void wait_for_completion() {
        join_all();
        if (failure_) {
            std::rethrow_exception(failure_);
        }
    }

  private:
    void join_all() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto &thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void worker_thread() {
        while (true) {
            std::size_t index;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&] { return stop_ || !jobs_.empty(); });
                if (failure_ || (stop_ && jobs_.empty())) {
                    break;
                }
                index = jobs_.front();
                jobs_.pop();
            }
            try {
                task_(index);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!failure_) {
                    failure_ = std::current_exception();
                }
                stop_ = true;
                cv_.notify_all();
                break;
            }
        }
    }

    std::function<void(std::size_t)> task_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::size_t> jobs_;
    bool stop_{false};
    std::exception_ptr failure_;
    std::vector<std::thread> threads_;
};

} // namespace

SplitPlanner::SplitPlanner(DescriptorResolver &resolver, BlockLocator &locator, std::size_t concurrency)
    : resolver_(resolver), estimator_(locator), concurrency_(concurrency) {
    if (concurrency_ == 0) {
        throw std::invalid_argument("concurrency must be > 0");
    }
}

std::size_t SplitPlanner::group_size(std::size_t reference_count, int max_workers) {
    const auto workers = static_cast<std::size_t>(std::max(max_workers, 1));
    return reference_count / workers + (reference_count % workers == 0 ? 0 : 1);
}

std::vector<std::string> SplitPlanner::hosts_for(const std::string &reference) const {
    auto hosts = estimator_.estimate(resolver_.resolve(reference));
    WORKSPLIT_LOG_DEBUG(reference << ": " << hosts.size() << " preferred hosts");
    return hosts;
}

std::size_t SplitPlanner::concurrency() const noexcept { return concurrency_; }

std::vector<std::vector<std::string>>
SplitPlanner::resolve_hosts(const std::vector<std::string> &references) const {
    std::vector<std::vector<std::string>> hosts(references.size());
    if (concurrency_ == 1 || references.size() < 2) {
        for (std::size_t i = 0; i < references.size(); ++i) {
            hosts[i] = hosts_for(references[i]);
        }
        return hosts;
    }

    HostResolutionPool pool(std::min(concurrency_, references.size()),
                            [&](std::size_t i) { hosts[i] = hosts_for(references[i]); });
    for (std::size_t i = 0; i < references.size(); ++i) {
        pool.submit(i);
    }
    pool.wait_for_completion();
    return hosts;
}

std::vector<SplitRecord> SplitPlanner::plan(const std::vector<std::string> &references,
                                            int max_workers) const {
    if (references.empty()) {
        throw NoInputError("no input references to plan");
    }

    auto hosts = resolve_hosts(references);
    const auto size = group_size(references.size(), max_workers);

    std::vector<SplitRecord> splits;
    splits.reserve(references.size() / size + 1);
    for (std::size_t begin = 0; begin < references.size(); begin += size) {
        const auto end = std::min(begin + size, references.size());
        std::vector<std::string> paths(references.begin() + begin, references.begin() + end);
        std::vector<std::string> preferred;
        std::unordered_set<std::string> seen;
        for (std::size_t i = begin; i < end; ++i) {
            for (auto &host : hosts[i]) {
                if (seen.insert(host).second) {
                    preferred.push_back(std::move(host));
                }
            }
        }
        splits.emplace_back(std::move(paths), std::move(preferred));
    }

    WORKSPLIT_LOG_INFO("planned " << splits.size() << " splits of up to " << size << " references from "
                                  << references.size() << " references");
    return splits;
}

std::vector<SplitRecord> SplitPlanner::plan_inputs(const std::vector<std::string> &roots,
                                                   int max_workers) const {
    if (roots.empty()) {
        throw NoInputError("no input roots given");
    }
    std::vector<std::string> references;
    for (const auto &root : roots) {
        auto listed = resolver_.list(root);
        WORKSPLIT_LOG_INFO("Found " << listed.size() << " input files at " << root);
        references.insert(references.end(), std::make_move_iterator(listed.begin()),
                          std::make_move_iterator(listed.end()));
    }
    if (references.empty()) {
        throw NoInputError("no input files found under the given roots");
    }
    return plan(references, max_workers);
}

} // namespace worksplit

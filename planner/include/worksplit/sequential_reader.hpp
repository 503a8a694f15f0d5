#pragma once

#include "worksplit/split_record.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace worksplit {

struct ReaderEntry {
    std::size_t index;
    std::string path;
};

// Forward-only iteration over the paths of a split owned by one worker.
class SequentialReader {
  public:
    enum class State { Unstarted, Positioned, Exhausted };

    explicit SequentialReader(SplitRecord split);

    // Moves to the next path; false once no path is left.
    bool advance();

    // Throws std::logic_error unless positioned on a path.
    ReaderEntry current() const;

    float progress() const noexcept;

    State state() const noexcept;

    const SplitRecord &split() const noexcept;

    const std::vector<std::string> &preferred_hosts() const noexcept;

    void close() noexcept;

  private:
    SplitRecord split_;
    State state_{State::Unstarted};
    std::size_t index_{0};
};

} // namespace worksplit

#include "worksplit/sequential_reader.hpp"

#include <stdexcept>
#include <utility>

namespace worksplit {

SequentialReader::SequentialReader(SplitRecord split) : split_(std::move(split)) {}

bool SequentialReader::advance() {
    const auto total = split_.paths().size();
    switch (state_) {
    case State::Unstarted:
        if (total == 0) {
            state_ = State::Exhausted;
            return false;
        }
        state_ = State::Positioned;
        index_ = 0;
        return true;
    case State::Positioned:
        if (index_ + 1 < total) {
            ++index_;
            return true;
        }
        state_ = State::Exhausted;
        return false;
    case State::Exhausted:
        break;
    }
    return false;
}

ReaderEntry SequentialReader::current() const {
    if (state_ != State::Positioned) {
        throw std::logic_error(state_ == State::Unstarted ? "reader has not been advanced"
                                                          : "reader is exhausted");
    }
    return ReaderEntry{index_, split_.paths()[index_]};
}

float SequentialReader::progress() const noexcept {
    if (state_ == State::Exhausted) {
        return 1.0f;
    }
    if (state_ == State::Unstarted) {
        return 0.0f;
    }
    return static_cast<float>(index_) / static_cast<float>(split_.paths().size());
}

SequentialReader::State SequentialReader::state() const noexcept { return state_; }

const SplitRecord &SequentialReader::split() const noexcept { return split_; }

const std::vector<std::string> &SequentialReader::preferred_hosts() const noexcept {
    return split_.preferred_hosts();
}

void SequentialReader::close() noexcept {}

} // namespace worksplit

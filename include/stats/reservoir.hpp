#pragma once

#include <cstddef>
#include <vector>

namespace trustwatch {
namespace stats {

/**
 * Append-only sample store with a hard ceiling. Once full, further
 * samples are dropped; existing samples are never replaced.
 */
template<typename T>
class Reservoir {
public:
    explicit Reservoir(size_t capacity = 0) : capacity_(capacity) {}

    // Returns false when the sample was dropped
    bool add(const T& value) {
        if (samples_.size() >= capacity_) return false;
        samples_.push_back(value);
        return true;
    }

    bool full() const { return samples_.size() >= capacity_; }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    size_t capacity() const { return capacity_; }

    const std::vector<T>& samples() const { return samples_; }
    typename std::vector<T>::const_iterator begin() const { return samples_.begin(); }
    typename std::vector<T>::const_iterator end() const { return samples_.end(); }

    void clear() { samples_.clear(); }

private:
    size_t capacity_;
    std::vector<T> samples_;
};

} // namespace stats
} // namespace trustwatch

#ifndef ROLLING_WINDOW_HPP
#define ROLLING_WINDOW_HPP

#include <cstddef>
#include <deque>
#include <stdexcept>

namespace engagement {

// Fixed-capacity FIFO of recent per-frame values. Pushing into a full window
// evicts the oldest value, so size() never exceeds capacity().
template <typename T>
class RollingWindow {
public:
    using const_iterator = typename std::deque<T>::const_iterator;

    explicit RollingWindow(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("RollingWindow capacity must be positive");
        }
    }

    void push(const T& value) {
        if (values_.size() == capacity_) {
            values_.pop_front();
        }
        values_.push_back(value);
    }

    void popFront() { values_.pop_front(); }
    const T& front() const { return values_.front(); }
    const T& back() const { return values_.back(); }

    void clear() { values_.clear(); }

    size_t size() const { return values_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return values_.empty(); }
    bool full() const { return values_.size() == capacity_; }

    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    // Arithmetic mean, 0 for an empty window.
    double mean() const {
        if (values_.empty()) {
            return 0.0;
        }
        double sum = 0.0;
        for (const auto& v : values_) {
            sum += static_cast<double>(v);
        }
        return sum / static_cast<double>(values_.size());
    }

    // Population variance, 0 with fewer than two samples.
    double variance() const {
        if (values_.size() < 2) {
            return 0.0;
        }
        double m = mean();
        double acc = 0.0;
        for (const auto& v : values_) {
            double d = static_cast<double>(v) - m;
            acc += d * d;
        }
        return acc / static_cast<double>(values_.size());
    }

    bool operator==(const RollingWindow& other) const {
        return capacity_ == other.capacity_ && values_ == other.values_;
    }
    bool operator!=(const RollingWindow& other) const { return !(*this == other); }

private:
    size_t capacity_;
    std::deque<T> values_;
};

} // namespace engagement

#endif // ROLLING_WINDOW_HPP

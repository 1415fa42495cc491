#pragma once
#include <cstddef>
#include <vector>

namespace voxcall {

// Fixed-capacity ring; once full, each push overwrites the oldest slot.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t n) : data_(n), n_(n) {}

    void push(T v) {
        if (n_ == 0) return;
        data_[idx_] = std::move(v);
        idx_ = (idx_ + 1) % n_;
        filled_ = filled_ || idx_ == 0;
    }

    std::size_t size() const { return filled_ ? n_ : idx_; }
    std::size_t capacity() const { return n_; }
    bool empty() const { return size() == 0; }

    void clear() {
        data_.assign(n_, T{});
        idx_ = 0;
        filled_ = false;
    }

    // 0 is the most recent entry.
    const T& newest(std::size_t i) const { return data_[(idx_ + n_ - 1 - i) % n_]; }

    std::vector<T> newestFirst() const {
        std::vector<T> out;
        out.reserve(size());
        for (std::size_t i = 0; i < size(); ++i) out.push_back(newest(i));
        return out;
    }

private:
    std::vector<T> data_;
    std::size_t n_{};
    std::size_t idx_{};
    bool filled_{};
};

} // namespace voxcall

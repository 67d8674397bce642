#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace isr::path {

/// Indexable min-heap of cell indices [0..N) keyed by (priority, sequence).
///
/// Every push or decrease stamps the entry with a fresh, increasing sequence
/// number, so among equal priorities the entry inserted earliest pops first.
/// This makes expansion order (and therefore the reported path) reproducible.
class Frontier {
public:
    using Index = u32;

    explicit Frontier(size_t capacity)
        : pos_(capacity, NOT_IN_HEAP), key_(capacity) {
        heap_.reserve(capacity < 1024 ? capacity : 1024);
    }

    bool empty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }

    bool contains(Index i) const { return pos_[i] != NOT_IN_HEAP; }

    /// Insert `i`, or lower its priority if already queued.
    /// Returns false (and changes nothing) if `i` is queued with a priority
    /// that is not higher than `priority`.
    bool push_or_decrease(Index i, f64 priority) {
        if (pos_[i] == NOT_IN_HEAP) {
            key_[i] = {priority, next_seq_++};
            heap_.push_back(i);
            pos_[i] = heap_.size() - 1;
            sift_up(pos_[i]);
            return true;
        }
        if (priority < key_[i].priority) {
            key_[i] = {priority, next_seq_++};
            sift_up(pos_[i]);
            return true;
        }
        return false;
    }

    /// Remove and return the entry with the lowest (priority, sequence).
    /// Precondition: !empty().
    Index pop_min() {
        const Index min_idx = heap_.front();
        const Index last = heap_.back();
        heap_.pop_back();
        pos_[min_idx] = NOT_IN_HEAP;

        if (!heap_.empty()) {
            heap_.front() = last;
            pos_[last] = 0;
            sift_down(0);
        }
        return min_idx;
    }

    f64 priority(Index i) const { return key_[i].priority; }

private:
    struct Key {
        f64 priority = 0.0;
        u64 seq = 0;
    };

    static constexpr size_t NOT_IN_HEAP = static_cast<size_t>(-1);

    bool less(Index a, Index b) const {
        const Key& ka = key_[a];
        const Key& kb = key_[b];
        if (ka.priority != kb.priority) return ka.priority < kb.priority;
        return ka.seq < kb.seq;
    }

    void sift_up(size_t i) {
        while (i > 0) {
            size_t p = (i - 1) / 2;
            if (!less(heap_[i], heap_[p])) break;
            std::swap(heap_[i], heap_[p]);
            pos_[heap_[i]] = i;
            pos_[heap_[p]] = p;
            i = p;
        }
    }

    void sift_down(size_t i) {
        const size_t n = heap_.size();
        for (;;) {
            const size_t l = 2 * i + 1;
            const size_t r = l + 1;
            size_t s = i;
            if (l < n && less(heap_[l], heap_[s])) s = l;
            if (r < n && less(heap_[r], heap_[s])) s = r;
            if (s == i) break;
            std::swap(heap_[i], heap_[s]);
            pos_[heap_[i]] = i;
            pos_[heap_[s]] = s;
            i = s;
        }
    }

    std::vector<Index> heap_;  // heap of cell indices
    std::vector<size_t> pos_;  // pos_[i] = slot of i in heap_, or NOT_IN_HEAP
    std::vector<Key> key_;
    u64 next_seq_ = 0;
};

} // namespace isr::path

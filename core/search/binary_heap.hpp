#pragma once

#include "search/priority_queue.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace congraph {

/// Array-backed binary min-heap.
/// Ties on the key are broken by insertion order, so equal-key items
/// come out FIFO; this keeps BFS (unit cost) breadth-first.
template <typename Item>
class BinaryHeap : public PriorityQueue<Item> {
public:
    void insert(Item item, double key) override {
        entries_.push_back(Entry{key, next_seq_++, std::move(item)});
        std::push_heap(entries_.begin(), entries_.end(), Greater{});
    }

    std::optional<Item> extractMin() override {
        if (entries_.empty()) return std::nullopt;
        std::pop_heap(entries_.begin(), entries_.end(), Greater{});
        Item top = std::move(entries_.back().item);
        entries_.pop_back();
        return top;
    }

    bool isEmpty() const override { return entries_.empty(); }

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        double key;
        uint64_t seq;
        Item item;
    };

    struct Greater {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.key != b.key) return a.key > b.key;
            return a.seq > b.seq;
        }
    };

    std::vector<Entry> entries_;
    uint64_t next_seq_ = 0;
};

} // namespace congraph

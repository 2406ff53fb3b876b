#pragma once

#include <optional>

namespace congraph {

/// Min-priority queue used by the shortest-path search.
/// Must accept several entries for the same item: the search never
/// updates a key in place, it inserts a fresh entry and skips the stale
/// ones when they surface (lazy deletion).
template <typename Item>
class PriorityQueue {
public:
    virtual ~PriorityQueue() = default;

    virtual void insert(Item item, double key) = 0;

    /// Remove and return the item with the smallest key, if any.
    virtual std::optional<Item> extractMin() = 0;

    virtual bool isEmpty() const = 0;
};

} // namespace congraph

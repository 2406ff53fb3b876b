#pragma once

#include "graph/vertex.hpp"
#include "search/binary_heap.hpp"
#include "util/config.hpp"
#include "util/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <future>
#include <limits>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace congraph {

/// Outcome of a search from source to one destination.
/// path is empty and distance is +inf when destination is unreachable.
template <typename T>
struct SearchResult {
    T source;
    T destination;
    std::optional<std::vector<Edge<T>>> path;
    double distance = std::numeric_limits<double>::infinity();

    bool reachable() const { return path.has_value(); }
};

/// Distances and predecessors left behind by one run of the search.
/// Read-only once built, so results can be extracted concurrently.
template <typename T>
struct ShortestPathTree {
    T source;
    std::unordered_map<T, double> distance;
    std::unordered_map<T, std::optional<T>> predecessor;  // nullopt for the source
};

// ─── ShortestPathSearch ────────────────────────────────────────
// Priority-first search over a vertex map. BFS and Dijkstra are the
// same routine with a different per-edge cost:
//   BFS       cost(e) = 1
//   Dijkstra  cost(e) = e.weight()
// The queue uses lazy deletion: an improved distance pushes a new entry,
// and entries of already finalized vertices are skipped when popped.

template <typename T>
class ShortestPathSearch {
public:
    using CostFn = std::function<double(const Edge<T>&)>;
    using StopFn = std::function<bool(const T&)>;

    explicit ShortestPathSearch(const VertexMap<T>& vertices) : vertices_(vertices) {}

    static double unitCost(const Edge<T>&) { return 1.0; }

    static double weightCost(const Edge<T>& e) {
        if (e.weight() < 0) {
            throw InvalidArgument("Negative weight on " + describe(e) +
                                  ": Dijkstra requires non-negative weights");
        }
        return e.weight();
    }

    /// Run the search from source. If stop is set, the search ends as soon
    /// as a vertex satisfying it is finalized.
    ShortestPathTree<T> run(const T& source, const CostFn& cost, const StopFn& stop = {}) const {
        if (!vertices_.count(source)) {
            throw VertexNotFound("Unknown source vertex " + describe(source));
        }

        ShortestPathTree<T> tree{source, {}, {}};
        tree.distance.reserve(vertices_.size());
        tree.predecessor.reserve(vertices_.size());
        tree.distance[source] = 0.0;
        tree.predecessor[source] = std::nullopt;

        std::unordered_set<T> finalized;
        BinaryHeap<T> queue;
        queue.insert(source, 0.0);

        while (!queue.isEmpty()) {
            // INVARIANT: the queue is not empty, so extractMin yields an item
            T current = *queue.extractMin();
            if (!finalized.insert(current).second) {
                continue;  // stale entry
            }
            if (stop && stop(current)) {
                break;
            }
            double current_distance = tree.distance.at(current);

            for (const auto& [dest, edge] : vertices_.at(current).adjacency()) {
                if (finalized.count(dest)) continue;
                double candidate = current_distance + cost(edge);
                auto it = tree.distance.find(dest);
                if (it == tree.distance.end() || candidate < it->second) {
                    tree.distance[dest] = candidate;
                    tree.predecessor[dest] = current;
                    queue.insert(dest, candidate);
                }
            }
        }
        return tree;
    }

    /// Build the result for one destination from a finished tree.
    SearchResult<T> resultFor(const ShortestPathTree<T>& tree, const T& destination) const {
        SearchResult<T> result{tree.source, destination, reconstructPath(tree, destination),
                               std::numeric_limits<double>::infinity()};
        auto it = tree.distance.find(destination);
        if (result.path && it != tree.distance.end()) {
            result.distance = it->second;
        }
        return result;
    }

    /// One result per vertex of the graph. Large graphs split the work
    /// across threads; each worker only reads the tree.
    std::unordered_map<T, SearchResult<T>> allResults(const ShortestPathTree<T>& tree,
                                                      const GraphConfig& config) const {
        std::vector<T> labels;
        labels.reserve(vertices_.size());
        for (const auto& [label, _] : vertices_) {
            labels.push_back(label);
        }

        std::unordered_map<T, SearchResult<T>> results;
        results.reserve(labels.size());

        unsigned workers = config.max_workers ? config.max_workers
                                              : std::max(1u, std::thread::hardware_concurrency());
        if (labels.size() < config.parallel_results_threshold || workers < 2) {
            for (const T& label : labels) {
                results.emplace(label, resultFor(tree, label));
            }
            return results;
        }

        size_t chunk = (labels.size() + workers - 1) / workers;
        spdlog::debug("[search] building {} results on {} workers", labels.size(), workers);

        using Batch = std::vector<SearchResult<T>>;
        std::vector<std::future<Batch>> batches;
        for (size_t begin = 0; begin < labels.size(); begin += chunk) {
            size_t end = std::min(labels.size(), begin + chunk);
            batches.push_back(std::async(std::launch::async, [this, &tree, &labels, begin, end] {
                Batch batch;
                batch.reserve(end - begin);
                for (size_t i = begin; i < end; i++) {
                    batch.push_back(resultFor(tree, labels[i]));
                }
                return batch;
            }));
        }
        for (auto& f : batches) {
            for (auto& r : f.get()) {
                T key = r.destination;
                results.emplace(std::move(key), std::move(r));
            }
        }
        return results;
    }

private:
    std::optional<std::vector<Edge<T>>> reconstructPath(const ShortestPathTree<T>& tree,
                                                        const T& destination) const {
        // The source has a predecessor entry (nullopt), so a missing entry means unreachable
        if (!tree.predecessor.count(destination)) {
            return std::nullopt;
        }
        std::vector<Edge<T>> path;
        T current = destination;
        while (true) {
            const std::optional<T>& pred = tree.predecessor.at(current);
            if (!pred) break;
            // INVARIANT: predecessors are only recorded along existing edges
            path.push_back(*vertices_.at(*pred).getEdgeTo(current));
            current = *pred;
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    const VertexMap<T>& vertices_;
};

} // namespace congraph

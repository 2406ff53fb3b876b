#pragma once

#include "analysis/components.hpp"
#include "graph/vertex.hpp"
#include "util/config.hpp"
#include "util/errors.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace congraph {

/// The two color classes of a bipartite graph.
template <typename T>
using Bipartition = std::pair<std::unordered_set<T>, std::unordered_set<T>>;

// ─── Classifier ────────────────────────────────────────────────
// Structural classes of a graph stored as a directed graph. An
// undirected edge is the pair (u, v), (v, u), so counts of "simple"
// (non-loop) edges are twice the undirected ones.

template <typename T>
class Classifier {
public:
    Classifier(const VertexMap<T>& vertices, const GraphConfig& config)
        : vertices_(vertices), config_(config) {}

    bool isComplete() const { return isComplete(vertices_); }

    bool isBipartite(Bipartition<T>* partitions = nullptr) const {
        return isBipartite(vertices_, partitions);
    }

    bool isCompleteBipartite() const { return isCompleteBipartite(vertices_); }

    /// Kuratowski's method: a graph is planar iff it has no subdivision of
    /// K5 or K3,3. Exhaustive, so factorial in n + m. Components that need
    /// the full reduction and exceed config.planarity_limit are rejected
    /// with SizeLimitExceeded.
    bool isPlanar() const {
        spdlog::debug("[planar] testing graph with {} vertices", vertices_.size());
        return isPlanarGraph(ComponentAnalyzer<T>::symmetricClosure(vertices_), &config_);
    }

    // ── Static forms, usable on any vertex map ──

    static size_t simpleEdgeCount(const VertexMap<T>& g) {
        size_t count = 0;
        for (const auto& [label, v] : g) {
            count += v.outDegree();
            if (v.hasEdgeTo(label)) count--;
        }
        return count;
    }

    static bool isComplete(const VertexMap<T>& g) {
        size_t n = g.size();
        return n == 0 || simpleEdgeCount(g) == n * (n - 1);
    }

    /// Two-coloring by BFS over the symmetric closure. Disconnected graphs
    /// are reported as not bipartite. On success the vertices colored like
    /// the starting vertex go to partitions->second.
    static bool isBipartite(const VertexMap<T>& g, Bipartition<T>* partitions) {
        if (g.size() < 2 || !ComponentAnalyzer<T>(g).isConnected()) {
            return false;
        }
        VertexMap<T> undirected = ComponentAnalyzer<T>::symmetricClosure(g);

        std::unordered_map<T, bool> colors;
        colors.reserve(undirected.size());
        std::deque<T> queue;

        const T& start = undirected.begin()->first;
        colors.emplace(start, false);
        queue.push_back(start);

        while (!queue.empty()) {
            T current = std::move(queue.front());
            queue.pop_front();
            bool color = colors.at(current);

            for (const auto& [dest, _] : undirected.at(current).adjacency()) {
                auto it = colors.find(dest);
                if (it == colors.end()) {
                    colors.emplace(dest, !color);
                    queue.push_back(dest);
                } else if (it->second == color) {
                    return false;
                }
            }
        }

        if (partitions) {
            partitions->first.clear();
            partitions->second.clear();
            for (const auto& [label, color] : colors) {
                (color ? partitions->first : partitions->second).insert(label);
            }
        }
        return true;
    }

    static bool isCompleteBipartite(const VertexMap<T>& g) {
        Bipartition<T> partitions;
        if (!isBipartite(g, &partitions)) {
            return false;
        }
        return simpleEdgeCount(g) == 2 * partitions.first.size() * partitions.second.size();
    }

private:
    /// g must be symmetric. limit is only passed at the outermost level:
    /// the recursive reductions run on strictly smaller graphs.
    static bool isPlanarGraph(const VertexMap<T>& g, const GraphConfig* limit) {
        ComponentAnalyzer<T> analyzer(g);
        for (const Component<T>& cc : analyzer.connectedComponents()) {
            if (!isPlanarComponent(ComponentAnalyzer<T>::inducedSubgraph(g, cc), limit)) {
                return false;
            }
        }
        return true;
    }

    static bool isPlanarComponent(const VertexMap<T>& g, const GraphConfig* limit) {
        size_t n = g.size();
        size_t m = simpleEdgeCount(g) / 2;

        if (n < 5) {
            return true;
        }
        if (m > 3 * n - 6) {
            return false;
        }
        if (isComplete(g)) {
            return false;
        }

        Bipartition<T> partitions;
        if (isBipartite(g, &partitions)) {
            size_t s1 = partitions.first.size();
            size_t s2 = partitions.second.size();
            if (s1 >= 3 && s2 >= 3 && m >= s1 * s2) {
                return false;  // contains K3,3
            }
        }

        if (limit && limit->planarity_limit > 0 && n + m > limit->planarity_limit) {
            spdlog::warn("[planar] component with n+m={} exceeds limit {}", n + m, limit->planarity_limit);
            throw SizeLimitExceeded("Planarity test needs exhaustive search on a component with n+m=" +
                                    std::to_string(n + m) + ", limit is " +
                                    std::to_string(limit->planarity_limit));
        }

        // Every graph obtained by deleting one vertex must be planar
        std::unordered_set<T> labels;
        for (const auto& [label, _] : g) {
            labels.insert(label);
        }
        for (const auto& [label, _] : g) {
            labels.erase(label);
            bool planar = isPlanarGraph(ComponentAnalyzer<T>::inducedSubgraph(g, labels), nullptr);
            labels.insert(label);
            if (!planar) return false;
        }

        // ... and so must every graph obtained by deleting one edge,
        // each undirected edge taken once in canonical order
        VertexMap<T> sub = g;
        for (const auto& [label, v] : g) {
            for (const auto& [dest, edge] : v.adjacency()) {
                if (!(label < dest)) continue;
                Edge<T> back = *sub.at(dest).deleteEdgeTo(label);
                sub.at(label).deleteEdgeTo(dest);
                bool planar = isPlanarGraph(sub, nullptr);
                sub.at(label).addEdgeTo(dest, edge.weight());
                sub.at(dest).addEdgeTo(label, back.weight());
                if (!planar) return false;
            }
        }
        return true;
    }

    const VertexMap<T>& vertices_;
    const GraphConfig& config_;
};

} // namespace congraph

#pragma once

#include "graph/vertex.hpp"
#include "search/shortest_path.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace congraph {

template <typename T>
using Component = std::unordered_set<T>;

/// Exit indices of a full depth-first traversal, counted down from |V|,
/// and whether a back edge was seen.
template <typename T>
struct DfsResult {
    std::unordered_map<T, size_t> exit_index;
    bool cyclic = false;
};

// ─── ComponentAnalyzer ─────────────────────────────────────────
// Traversal-based structure of a vertex map: topological order,
// acyclicity, strongly connected components (Kosaraju) and weakly
// connected components, plus the graph-to-graph derivations they need
// (transpose, symmetric/transitive closure, induced subgraph).
//
// Components with a single vertex are not reported.

template <typename T>
class ComponentAnalyzer {
public:
    explicit ComponentAnalyzer(const VertexMap<T>& vertices) : vertices_(vertices) {}

    // ── Traversal ──

    DfsResult<T> dfs() const {
        DfsState state(vertices_.size());
        for (const auto& [label, _] : vertices_) {
            if (state.clock == 0) break;  // every vertex already finished
            if (!state.entered.count(label)) {
                dfsFrom(vertices_, label, state, nullptr);
            }
        }
        return {std::move(state.exit_index), state.cyclic};
    }

    /// Labels by ascending exit index. Only a topological order when
    /// the graph is acyclic.
    std::vector<T> topologicalSort() const {
        DfsResult<T> result = dfs();
        std::vector<std::pair<size_t, T>> order;
        order.reserve(result.exit_index.size());
        for (auto& [label, index] : result.exit_index) {
            order.emplace_back(index, label);
        }
        std::sort(order.begin(), order.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<T> labels;
        labels.reserve(order.size());
        for (auto& entry : order) {
            labels.push_back(std::move(entry.second));
        }
        return labels;
    }

    bool isAcyclic() const { return !dfs().cyclic; }

    // ── Components ──

    /// Kosaraju: finishing order from the transpose, then one DFS tree of
    /// the original graph per component.
    std::vector<Component<T>> stronglyConnectedComponents() const {
        VertexMap<T> transposed = transpose(vertices_);
        std::vector<T> order = ComponentAnalyzer<T>(transposed).topologicalSort();

        std::vector<Component<T>> components;
        DfsState state(vertices_.size());
        for (const T& label : order) {
            if (state.clock == 0) break;
            if (state.entered.count(label)) continue;
            std::vector<T> tree;
            dfsFrom(vertices_, label, state, &tree);
            if (tree.size() > 1) {
                components.emplace_back(tree.begin(), tree.end());
            }
        }
        return components;
    }

    /// Components of the underlying undirected graph.
    std::vector<Component<T>> connectedComponents() const {
        VertexMap<T> undirected = symmetricClosure(vertices_);

        std::vector<Component<T>> components;
        DfsState state(undirected.size());
        for (const auto& [label, _] : vertices_) {
            if (state.clock == 0) break;
            if (state.entered.count(label)) continue;
            std::vector<T> tree;
            dfsFrom(undirected, label, state, &tree);
            if (tree.size() > 1) {
                components.emplace_back(tree.begin(), tree.end());
            }
        }
        return components;
    }

    bool isConnected() const {
        return coversAll(connectedComponents());
    }

    bool isStronglyConnected() const {
        return coversAll(stronglyConnectedComponents());
    }

    // ── Derived graphs ──

    /// Same vertices, no edges.
    static VertexMap<T> vertexCopy(const VertexMap<T>& g) {
        VertexMap<T> copy;
        copy.reserve(g.size());
        for (const auto& [label, v] : g) {
            copy.emplace(label, Vertex<T>(label, v.weight()));
        }
        return copy;
    }

    static VertexMap<T> transpose(const VertexMap<T>& g) {
        VertexMap<T> t = vertexCopy(g);
        for (const auto& [label, v] : g) {
            for (const auto& [dest, edge] : v.adjacency()) {
                t.at(dest).addEdgeTo(label, edge.weight());
            }
        }
        return t;
    }

    /// Adds (v, u) with the weight of (u, v) wherever only (u, v) exists.
    static VertexMap<T> symmetricClosure(const VertexMap<T>& g) {
        VertexMap<T> closure = g;
        for (const auto& [label, v] : g) {
            for (const auto& [dest, edge] : v.adjacency()) {
                Vertex<T>& reverse = closure.at(dest);
                if (!reverse.hasEdgeTo(label)) {
                    reverse.addEdgeTo(label, edge.weight());
                }
            }
        }
        return closure;
    }

    /// Edge (u, v) for every v reachable from u through at least one edge.
    /// Existing edges keep their weight; added ones weigh 1.
    static VertexMap<T> transitiveClosure(const VertexMap<T>& g) {
        VertexMap<T> closure = g;
        ShortestPathSearch<T> search(g);
        for (const auto& [label, v] : g) {
            ShortestPathTree<T> tree = search.run(label, ShortestPathSearch<T>::unitCost);
            bool on_cycle = false;
            for (const auto& [reached, _] : tree.distance) {
                if (g.at(reached).hasEdgeTo(label)) on_cycle = true;
                if (reached == label) continue;
                if (!v.hasEdgeTo(reached)) {
                    closure.at(label).addEdgeTo(reached, 1.0);
                }
            }
            if (on_cycle && !v.hasEdgeTo(label)) {
                closure.at(label).addEdgeTo(label, 1.0);
            }
        }
        return closure;
    }

    /// The vertices in labels and the edges between them.
    static VertexMap<T> inducedSubgraph(const VertexMap<T>& g, const std::unordered_set<T>& labels) {
        for (const T& label : labels) {
            if (!g.count(label)) {
                throw InvalidArgument("Invalid sub-graph: vertex " + describe(label) +
                                      " does not belong to the graph");
            }
        }
        VertexMap<T> sub;
        sub.reserve(labels.size());
        for (const T& label : labels) {
            sub.emplace(label, Vertex<T>(label, g.at(label).weight()));
        }
        for (const T& label : labels) {
            for (const auto& [dest, edge] : g.at(label).adjacency()) {
                if (labels.count(dest)) {
                    sub.at(label).addEdgeTo(dest, edge.weight());
                }
            }
        }
        return sub;
    }

private:
    struct DfsState {
        explicit DfsState(size_t n) : clock(n) {}

        std::unordered_set<T> entered;
        std::unordered_map<T, size_t> exit_index;
        size_t clock;  // counts down; 0 once every vertex is finished
        bool cyclic = false;
    };

    /// Explicit-stack DFS from first. Every vertex is pushed once for the
    /// pre-visit and once for the post-visit, where it gets its exit index.
    /// Vertices entered during this call are appended to tree.
    static void dfsFrom(const VertexMap<T>& g, const T& first, DfsState& state, std::vector<T>* tree) {
        std::vector<std::pair<T, bool>> stack;  // (vertex, post-visit)
        stack.emplace_back(first, false);

        do {
            auto [current, post] = stack.back();
            stack.pop_back();

            if (post) {
                state.exit_index[current] = --state.clock;
                continue;
            }
            if (!state.entered.insert(current).second) {
                continue;  // reached through another path meanwhile
            }
            if (tree) tree->push_back(current);
            stack.emplace_back(current, true);

            for (const auto& [dest, _] : g.at(current).adjacency()) {
                if (!state.entered.count(dest)) {
                    stack.emplace_back(dest, false);
                } else if (!state.exit_index.count(dest)) {
                    // dest is an unfinished ancestor: back edge
                    state.cyclic = true;
                }
            }
        } while (!stack.empty());
    }

    bool coversAll(const std::vector<Component<T>>& components) const {
        return components.size() == 1 && components.front().size() == vertices_.size();
    }

    const VertexMap<T>& vertices_;
};

} // namespace congraph

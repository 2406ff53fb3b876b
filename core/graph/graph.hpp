#pragma once

#include "analysis/classifier.hpp"
#include "analysis/components.hpp"
#include "graph/edge.hpp"
#include "graph/vertex.hpp"
#include "search/shortest_path.hpp"
#include "util/config.hpp"
#include "util/errors.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace congraph {

// ─── Graph ─────────────────────────────────────────────────────
// Directed weighted graph, safe to share between threads.
// Vertices are keyed by a caller-supplied label T (hashable, ordered,
// streamable). Each vertex owns its outgoing edges.
//
// Locking: one reader-writer lock per graph. Queries and algorithms hold
// it shared for their whole run; mutations hold it exclusively. Public
// methods never call each other while holding the lock, and vertices
// only leave the graph as copies.
//
// Invariant: both endpoints of every stored edge are vertices of the graph.

template <typename T>
class Graph {
public:
    using Component = congraph::Component<T>;
    using SearchResults = std::unordered_map<T, SearchResult<T>>;

    explicit Graph(GraphConfig config = {}) : config_(config) {}

    explicit Graph(const std::vector<T>& labels, GraphConfig config = {}) : config_(config) {
        for (const T& label : labels) {
            addVertex(label);
        }
    }

    /// Pre-populated graph. Throws UnknownVertex if an edge references a
    /// label missing from vertices.
    Graph(const std::vector<Vertex<T>>& vertices, const std::vector<Edge<T>>& edges,
          GraphConfig config = {})
        : config_(config) {
        for (const Vertex<T>& v : vertices) {
            addVertex(v.label(), v.weight());
        }
        for (const Edge<T>& e : edges) {
            addEdge(e.source(), e.destination(), e.weight());
        }
    }

    Graph(const Graph& other) {
        std::shared_lock lock(other.mutex_);
        vertices_ = other.vertices_;
        config_ = other.config_;
    }

    Graph(Graph&& other) {
        std::unique_lock lock(other.mutex_);
        vertices_ = std::move(other.vertices_);
        config_ = other.config_;
    }

    Graph& operator=(const Graph& other) {
        if (this != &other) {
            std::unique_lock mine(mutex_, std::defer_lock);
            std::shared_lock theirs(other.mutex_, std::defer_lock);
            std::lock(mine, theirs);
            vertices_ = other.vertices_;
            config_ = other.config_;
        }
        return *this;
    }

    Graph& operator=(Graph&& other) {
        if (this != &other) {
            std::unique_lock mine(mutex_, std::defer_lock);
            std::unique_lock theirs(other.mutex_, std::defer_lock);
            std::lock(mine, theirs);
            vertices_ = std::move(other.vertices_);
            config_ = other.config_;
        }
        return *this;
    }

    // ── Vertex operations ──

    /// Insert a vertex, replacing (with its edges) any vertex already
    /// holding label.
    void addVertex(const T& label, double weight = 0.0);
    std::optional<Vertex<T>> getVertex(const T& label) const;
    bool hasVertex(const T& label) const;
    /// Remove a vertex and every edge pointing to it.
    std::optional<Vertex<T>> deleteVertex(const T& label);
    std::vector<Vertex<T>> getVertices() const;
    size_t vertexCount() const;

    // ── Edge operations ──

    /// Add source → destination, overwriting the weight of an existing
    /// edge between them. Returns true iff an edge was overwritten.
    bool addEdge(const T& source, const T& destination, double weight = 1.0);
    std::optional<Edge<T>> getEdge(const T& source, const T& destination) const;
    bool hasEdge(const T& source, const T& destination) const;
    std::optional<Edge<T>> deleteEdge(const T& source, const T& destination);
    std::vector<Edge<T>> getEdges() const;
    /// All edges except loops.
    std::vector<Edge<T>> getSimpleEdges() const;
    std::vector<Edge<T>> getEdgesFrom(const T& source) const;
    std::vector<Edge<T>> getEdgesTo(const T& destination) const;
    size_t edgeCount() const;

    // ── Search ──
    // Both throw VertexNotFound for an unknown source or destination.

    SearchResults bfs(const T& source) const;
    SearchResult<T> bfs(const T& source, const T& destination) const;
    SearchResults dijkstra(const T& source) const;
    SearchResult<T> dijkstra(const T& source, const T& destination) const;

    // ── Structure ──

    std::vector<T> topologicalSort() const;
    bool isAcyclic() const;
    bool isConnected() const;
    bool isStronglyConnected() const;
    std::vector<Component> connectedComponents() const;
    std::vector<Component> stronglyConnectedComponents() const;

    Graph transpose() const;
    Graph symmetricClosure() const;
    Graph transitiveClosure() const;
    /// Throws InvalidArgument if a label is not in the graph.
    Graph inducedSubGraph(const std::unordered_set<T>& labels) const;

    // ── Classification ──

    bool isComplete() const;
    bool isBipartite() const;
    bool isBipartite(Bipartition<T>& partitions) const;
    bool isCompleteBipartite() const;
    bool isPlanar() const;

    // ── Configuration ──

    GraphConfig config() const;
    void setConfig(const GraphConfig& config);

    // ── Iteration ──
    // fn runs on a copy taken under the lock, so it may call back into the graph.

    void forEachVertex(const std::function<void(const Vertex<T>&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge<T>&)>& fn) const;

private:
    static Graph adopt(VertexMap<T> vertices, const GraphConfig& config) {
        Graph g(config);
        g.vertices_ = std::move(vertices);
        return g;
    }

    void requireVertex(const T& label) const {
        if (!vertices_.count(label)) {
            spdlog::warn("[search] unknown vertex {}", describe(label));
            throw VertexNotFound("Unknown vertex " + describe(label));
        }
    }

    /// Dijkstra only relaxes edges into unfinalized vertices, so a negative
    /// weight can go unseen during the search. Checked up front instead.
    void requireNonNegativeWeights() const {
        for (const auto& [_, v] : vertices_) {
            for (const auto& [__, e] : v.adjacency()) {
                if (e.weight() < 0) {
                    spdlog::warn("[search] negative weight on {}", describe(e));
                    throw InvalidArgument("Negative weight on " + describe(e) +
                                          ": Dijkstra requires non-negative weights");
                }
            }
        }
    }

    SearchResults allDestinations(const T& source,
                                  const typename ShortestPathSearch<T>::CostFn& cost) const;
    SearchResult<T> singleDestination(const T& source, const T& destination,
                                      const typename ShortestPathSearch<T>::CostFn& cost) const;

    mutable std::shared_mutex mutex_;
    VertexMap<T> vertices_;
    GraphConfig config_;
};

/// K_n over labels 1..n. Throws InvalidArgument if n < 1.
Graph<int> completeGraph(int n);

/// K_{n,m} over labels 1..n and n+1..n+m. Throws InvalidArgument if n or m < 1.
Graph<int> completeBipartiteGraph(int n, int m);

// ─── Vertex operations ─────────────────────────────────────────

template <typename T>
void Graph<T>::addVertex(const T& label, double weight) {
    Vertex<T> vertex(label, weight);
    std::unique_lock lock(mutex_);
    vertices_.insert_or_assign(label, std::move(vertex));
    spdlog::debug("[graph] add vertex {}", describe(label));
}

template <typename T>
std::optional<Vertex<T>> Graph<T>::getVertex(const T& label) const {
    std::shared_lock lock(mutex_);
    auto it = vertices_.find(label);
    if (it == vertices_.end()) return std::nullopt;
    return it->second;
}

template <typename T>
bool Graph<T>::hasVertex(const T& label) const {
    std::shared_lock lock(mutex_);
    return vertices_.count(label) > 0;
}

template <typename T>
std::optional<Vertex<T>> Graph<T>::deleteVertex(const T& label) {
    std::unique_lock lock(mutex_);
    auto it = vertices_.find(label);
    if (it == vertices_.end()) return std::nullopt;

    // Strip incoming edges first, so no edge is left dangling
    for (auto& [other, v] : vertices_) {
        if (!(other == label)) {
            v.deleteEdgeTo(label);
        }
    }
    Vertex<T> removed = std::move(it->second);
    vertices_.erase(it);
    spdlog::debug("[graph] delete vertex {}", describe(label));
    return removed;
}

template <typename T>
std::vector<Vertex<T>> Graph<T>::getVertices() const {
    std::shared_lock lock(mutex_);
    std::vector<Vertex<T>> result;
    result.reserve(vertices_.size());
    for (const auto& [_, v] : vertices_) {
        result.push_back(v);
    }
    return result;
}

template <typename T>
size_t Graph<T>::vertexCount() const {
    std::shared_lock lock(mutex_);
    return vertices_.size();
}

// ─── Edge operations ───────────────────────────────────────────

template <typename T>
bool Graph<T>::addEdge(const T& source, const T& destination, double weight) {
    std::unique_lock lock(mutex_);
    if (!vertices_.count(destination)) {
        spdlog::warn("[graph] rejected edge {} -> {}: unknown destination",
                     describe(source), describe(destination));
        throw UnknownVertex("Unknown vertex " + describe(destination));
    }
    auto it = vertices_.find(source);
    if (it == vertices_.end()) {
        spdlog::warn("[graph] rejected edge {} -> {}: unknown source",
                     describe(source), describe(destination));
        throw UnknownVertex("Unknown vertex " + describe(source));
    }
    bool overwritten = it->second.addEdgeTo(destination, weight);
    spdlog::debug("[graph] {} edge {} -> {} ({})", overwritten ? "overwrite" : "add",
                  describe(source), describe(destination), weight);
    return overwritten;
}

template <typename T>
std::optional<Edge<T>> Graph<T>::getEdge(const T& source, const T& destination) const {
    std::shared_lock lock(mutex_);
    auto it = vertices_.find(source);
    if (it == vertices_.end()) return std::nullopt;
    return it->second.getEdgeTo(destination);
}

template <typename T>
bool Graph<T>::hasEdge(const T& source, const T& destination) const {
    std::shared_lock lock(mutex_);
    auto it = vertices_.find(source);
    return it != vertices_.end() && it->second.hasEdgeTo(destination);
}

template <typename T>
std::optional<Edge<T>> Graph<T>::deleteEdge(const T& source, const T& destination) {
    std::unique_lock lock(mutex_);
    auto it = vertices_.find(source);
    if (it == vertices_.end()) return std::nullopt;
    auto removed = it->second.deleteEdgeTo(destination);
    if (removed) {
        spdlog::debug("[graph] delete edge {} -> {}", describe(source), describe(destination));
    }
    return removed;
}

template <typename T>
std::vector<Edge<T>> Graph<T>::getEdges() const {
    std::shared_lock lock(mutex_);
    std::vector<Edge<T>> edges;
    for (const auto& [_, v] : vertices_) {
        for (const auto& [__, e] : v.adjacency()) {
            edges.push_back(e);
        }
    }
    return edges;
}

template <typename T>
std::vector<Edge<T>> Graph<T>::getSimpleEdges() const {
    std::shared_lock lock(mutex_);
    std::vector<Edge<T>> edges;
    for (const auto& [_, v] : vertices_) {
        for (const auto& [__, e] : v.adjacency()) {
            if (!e.isLoop()) edges.push_back(e);
        }
    }
    return edges;
}

template <typename T>
std::vector<Edge<T>> Graph<T>::getEdgesFrom(const T& source) const {
    std::shared_lock lock(mutex_);
    auto it = vertices_.find(source);
    if (it == vertices_.end()) return {};
    return it->second.outEdges();
}

template <typename T>
std::vector<Edge<T>> Graph<T>::getEdgesTo(const T& destination) const {
    std::shared_lock lock(mutex_);
    std::vector<Edge<T>> edges;
    for (const auto& [_, v] : vertices_) {
        if (auto e = v.getEdgeTo(destination)) {
            edges.push_back(*e);
        }
    }
    return edges;
}

template <typename T>
size_t Graph<T>::edgeCount() const {
    std::shared_lock lock(mutex_);
    size_t count = 0;
    for (const auto& [_, v] : vertices_) {
        count += v.outDegree();
    }
    return count;
}

// ─── Search ────────────────────────────────────────────────────

template <typename T>
typename Graph<T>::SearchResults Graph<T>::bfs(const T& source) const {
    std::shared_lock lock(mutex_);
    return allDestinations(source, ShortestPathSearch<T>::unitCost);
}

template <typename T>
SearchResult<T> Graph<T>::bfs(const T& source, const T& destination) const {
    std::shared_lock lock(mutex_);
    return singleDestination(source, destination, ShortestPathSearch<T>::unitCost);
}

template <typename T>
typename Graph<T>::SearchResults Graph<T>::dijkstra(const T& source) const {
    std::shared_lock lock(mutex_);
    requireVertex(source);
    requireNonNegativeWeights();
    return allDestinations(source, ShortestPathSearch<T>::weightCost);
}

template <typename T>
SearchResult<T> Graph<T>::dijkstra(const T& source, const T& destination) const {
    std::shared_lock lock(mutex_);
    requireVertex(source);
    requireVertex(destination);
    requireNonNegativeWeights();
    return singleDestination(source, destination, ShortestPathSearch<T>::weightCost);
}

template <typename T>
typename Graph<T>::SearchResults Graph<T>::allDestinations(
        const T& source, const typename ShortestPathSearch<T>::CostFn& cost) const {
    requireVertex(source);
    spdlog::debug("[search] all destinations from {}", describe(source));
    ShortestPathSearch<T> search(vertices_);
    ShortestPathTree<T> tree = search.run(source, cost);
    return search.allResults(tree, config_);
}

template <typename T>
SearchResult<T> Graph<T>::singleDestination(
        const T& source, const T& destination,
        const typename ShortestPathSearch<T>::CostFn& cost) const {
    requireVertex(source);
    requireVertex(destination);
    spdlog::debug("[search] {} -> {}", describe(source), describe(destination));
    ShortestPathSearch<T> search(vertices_);
    ShortestPathTree<T> tree = search.run(source, cost,
        [&destination](const T& current) { return current == destination; });
    return search.resultFor(tree, destination);
}

// ─── Structure ─────────────────────────────────────────────────

template <typename T>
std::vector<T> Graph<T>::topologicalSort() const {
    std::shared_lock lock(mutex_);
    return ComponentAnalyzer<T>(vertices_).topologicalSort();
}

template <typename T>
bool Graph<T>::isAcyclic() const {
    std::shared_lock lock(mutex_);
    return ComponentAnalyzer<T>(vertices_).isAcyclic();
}

template <typename T>
bool Graph<T>::isConnected() const {
    std::shared_lock lock(mutex_);
    return ComponentAnalyzer<T>(vertices_).isConnected();
}

template <typename T>
bool Graph<T>::isStronglyConnected() const {
    std::shared_lock lock(mutex_);
    return ComponentAnalyzer<T>(vertices_).isStronglyConnected();
}

template <typename T>
std::vector<typename Graph<T>::Component> Graph<T>::connectedComponents() const {
    std::shared_lock lock(mutex_);
    return ComponentAnalyzer<T>(vertices_).connectedComponents();
}

template <typename T>
std::vector<typename Graph<T>::Component> Graph<T>::stronglyConnectedComponents() const {
    std::shared_lock lock(mutex_);
    return ComponentAnalyzer<T>(vertices_).stronglyConnectedComponents();
}

template <typename T>
Graph<T> Graph<T>::transpose() const {
    std::shared_lock lock(mutex_);
    return adopt(ComponentAnalyzer<T>::transpose(vertices_), config_);
}

template <typename T>
Graph<T> Graph<T>::symmetricClosure() const {
    std::shared_lock lock(mutex_);
    return adopt(ComponentAnalyzer<T>::symmetricClosure(vertices_), config_);
}

template <typename T>
Graph<T> Graph<T>::transitiveClosure() const {
    std::shared_lock lock(mutex_);
    return adopt(ComponentAnalyzer<T>::transitiveClosure(vertices_), config_);
}

template <typename T>
Graph<T> Graph<T>::inducedSubGraph(const std::unordered_set<T>& labels) const {
    std::shared_lock lock(mutex_);
    return adopt(ComponentAnalyzer<T>::inducedSubgraph(vertices_, labels), config_);
}

// ─── Classification ────────────────────────────────────────────

template <typename T>
bool Graph<T>::isComplete() const {
    std::shared_lock lock(mutex_);
    return Classifier<T>(vertices_, config_).isComplete();
}

template <typename T>
bool Graph<T>::isBipartite() const {
    std::shared_lock lock(mutex_);
    return Classifier<T>(vertices_, config_).isBipartite();
}

template <typename T>
bool Graph<T>::isBipartite(Bipartition<T>& partitions) const {
    std::shared_lock lock(mutex_);
    return Classifier<T>(vertices_, config_).isBipartite(&partitions);
}

template <typename T>
bool Graph<T>::isCompleteBipartite() const {
    std::shared_lock lock(mutex_);
    return Classifier<T>(vertices_, config_).isCompleteBipartite();
}

template <typename T>
bool Graph<T>::isPlanar() const {
    std::shared_lock lock(mutex_);
    return Classifier<T>(vertices_, config_).isPlanar();
}

// ─── Configuration ─────────────────────────────────────────────

template <typename T>
GraphConfig Graph<T>::config() const {
    std::shared_lock lock(mutex_);
    return config_;
}

template <typename T>
void Graph<T>::setConfig(const GraphConfig& config) {
    std::unique_lock lock(mutex_);
    config_ = config;
}

// ─── Iteration ─────────────────────────────────────────────────

template <typename T>
void Graph<T>::forEachVertex(const std::function<void(const Vertex<T>&)>& fn) const {
    for (const auto& v : getVertices()) {
        fn(v);
    }
}

template <typename T>
void Graph<T>::forEachEdge(const std::function<void(const Edge<T>&)>& fn) const {
    for (const auto& e : getEdges()) {
        fn(e);
    }
}

extern template class Graph<std::string>;
extern template class Graph<int>;

} // namespace congraph

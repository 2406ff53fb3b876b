#pragma once

#include "graph/edge.hpp"
#include "util/errors.hpp"

#include <cmath>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <utility>
#include <vector>

namespace congraph {

/// A vertex of the graph: label, weight and its outgoing edges keyed by
/// destination label.
/// Vertices live inside a Graph and are only mutated under the Graph's
/// exclusive lock; callers outside the Graph receive copies.
template <typename T>
class Vertex {
public:
    explicit Vertex(T label, double weight = 1.0)
        : label_(std::move(label)), weight_(weight) {
        if (std::isnan(weight_)) {
            throw InvalidArgument("NaN weight for vertex " + describe(label_));
        }
    }

    const T& label() const { return label_; }
    double weight() const { return weight_; }

    /// Add (or overwrite) the edge towards destination.
    /// Returns true iff an edge to destination already existed.
    bool addEdgeTo(const T& destination, double weight) {
        if (std::isnan(weight)) {
            throw InvalidArgument("NaN weight for edge " + describe(label_) +
                                  " -> " + describe(destination));
        }
        auto it = adj_.find(destination);
        if (it != adj_.end()) {
            it->second = Edge<T>(label_, destination, weight);
            return true;
        }
        adj_.emplace(destination, Edge<T>(label_, destination, weight));
        return false;
    }

    std::optional<Edge<T>> getEdgeTo(const T& destination) const {
        auto it = adj_.find(destination);
        if (it == adj_.end()) return std::nullopt;
        return it->second;
    }

    bool hasEdgeTo(const T& destination) const { return adj_.count(destination) > 0; }

    /// Remove the edge towards destination, returning it if it existed.
    std::optional<Edge<T>> deleteEdgeTo(const T& destination) {
        auto it = adj_.find(destination);
        if (it == adj_.end()) return std::nullopt;
        Edge<T> removed = std::move(it->second);
        adj_.erase(it);
        return removed;
    }

    std::vector<Edge<T>> outEdges() const {
        std::vector<Edge<T>> edges;
        edges.reserve(adj_.size());
        for (const auto& [_, edge] : adj_) {
            edges.push_back(edge);
        }
        return edges;
    }

    size_t outDegree() const { return adj_.size(); }

    /// Read-only view of the adjacency, used by the algorithms that run
    /// under the owning Graph's lock.
    const std::unordered_map<T, Edge<T>>& adjacency() const { return adj_; }

private:
    T label_;
    double weight_;
    std::unordered_map<T, Edge<T>> adj_;
};

template <typename T>
std::ostream& operator<<(std::ostream& out, const Vertex<T>& v) {
    return out << "Vertex(" << v.label() << ", " << v.weight() << ")";
}

/// The storage every algorithm works on: label → Vertex.
template <typename T>
using VertexMap = std::unordered_map<T, Vertex<T>>;

} // namespace congraph

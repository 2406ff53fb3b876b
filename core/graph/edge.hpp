#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

namespace congraph {

/// A directed, weighted edge source → destination.
/// Immutable once built. Identity is the (source, destination) pair:
/// two edges between the same endpoints are the same edge whatever
/// their weights.
template <typename T>
class Edge {
public:
    Edge(T source, T destination, double weight = 1.0)
        : source_(std::move(source)), destination_(std::move(destination)), weight_(weight) {}

    const T& source() const { return source_; }
    const T& destination() const { return destination_; }
    double weight() const { return weight_; }

    bool isLoop() const { return source_ == destination_; }

    bool operator==(const Edge& other) const {
        return source_ == other.source_ && destination_ == other.destination_;
    }
    bool operator!=(const Edge& other) const { return !(*this == other); }

private:
    T source_;
    T destination_;
    double weight_;
};

template <typename T>
std::ostream& operator<<(std::ostream& out, const Edge<T>& e) {
    return out << "Edge(" << e.source() << " -> " << e.destination() << " | " << e.weight() << ")";
}

} // namespace congraph

namespace std {

template <typename T>
struct hash<congraph::Edge<T>> {
    size_t operator()(const congraph::Edge<T>& e) const {
        size_t h = std::hash<T>{}(e.source());
        return h * 31 + std::hash<T>{}(e.destination());
    }
};

} // namespace std

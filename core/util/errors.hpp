#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace congraph {

// ─── Error taxonomy ────────────────────────────────────────────
// Structural violations are thrown at the call that detects them.
// Normal absence (unknown label on a lookup) is an empty optional.

class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed argument: NaN weight, label set not contained in the graph,
/// non-positive factory size, negative weight seen by Dijkstra.
class InvalidArgument : public GraphError {
public:
    using GraphError::GraphError;
};

/// An edge endpoint is not a vertex of the graph.
class UnknownVertex : public GraphError {
public:
    using GraphError::GraphError;
};

/// A search was started from (or towards) a vertex that does not exist.
class VertexNotFound : public GraphError {
public:
    using GraphError::GraphError;
};

/// The exhaustive planarity reduction was asked to run on a component
/// larger than GraphConfig::planarity_limit.
class SizeLimitExceeded : public GraphError {
public:
    using GraphError::GraphError;
};

/// Render a label for diagnostics. Labels must be streamable.
template <typename T>
std::string describe(const T& label) {
    std::ostringstream out;
    out << label;
    return out.str();
}

} // namespace congraph

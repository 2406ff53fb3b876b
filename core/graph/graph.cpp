#include "graph/graph.hpp"

#include <string>

namespace congraph {

template class Graph<std::string>;
template class Graph<int>;

// ─── Factories ─────────────────────────────────────────────────

Graph<int> completeGraph(int n) {
    if (n < 1) {
        throw InvalidArgument("n must be positive");
    }
    Graph<int> graph;
    for (int i = 1; i <= n; i++) {
        graph.addVertex(i);
    }
    for (int i = 1; i <= n; i++) {
        for (int j = i + 1; j <= n; j++) {
            graph.addEdge(i, j);
            graph.addEdge(j, i);
        }
    }
    return graph;
}

Graph<int> completeBipartiteGraph(int n, int m) {
    if (n < 1) {
        throw InvalidArgument("n must be positive");
    }
    if (m < 1) {
        throw InvalidArgument("m must be positive");
    }
    Graph<int> graph;
    for (int i = 1; i <= n + m; i++) {
        graph.addVertex(i);
    }
    for (int i = 1; i <= n; i++) {
        for (int j = n + 1; j <= n + m; j++) {
            graph.addEdge(i, j);
            graph.addEdge(j, i);
        }
    }
    return graph;
}

} // namespace congraph

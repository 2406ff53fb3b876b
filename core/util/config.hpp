#pragma once

#include <cstddef>

namespace congraph {

/// Tunables shared by a Graph and every graph derived from it
/// (transpose, closures, induced subgraphs).
struct GraphConfig {
    // Max n + m for the exhaustive planarity test, 0 = unbounded. The
    // reduction is only sound up to n + m = 15: above that it can report
    // subdivisions of K5 or K3,3 as planar.
    size_t planarity_limit = 15;
    size_t parallel_results_threshold = 256;  // vertex count from which all-destinations results are built in parallel
    unsigned max_workers = 0;                 // 0 = std::thread::hardware_concurrency()
};

} // namespace congraph

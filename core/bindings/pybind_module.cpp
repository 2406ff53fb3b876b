// PyBind11 bindings for the congraph core.
// Exposes Graph (string labels), Edge, Vertex, SearchResult and GraphConfig.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DCONGRAPH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "graph/graph.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

#include <string>

namespace py = pybind11;

using Label = std::string;
using PyGraph = congraph::Graph<Label>;

PYBIND11_MODULE(congraph_bindings, m) {
    m.doc() = "congraph C++ Core Bindings";

    // ── Errors ──
    auto graph_error = py::register_exception<congraph::GraphError>(m, "GraphError");
    py::register_exception<congraph::InvalidArgument>(m, "InvalidArgument", graph_error.ptr());
    py::register_exception<congraph::UnknownVertex>(m, "UnknownVertex", graph_error.ptr());
    py::register_exception<congraph::VertexNotFound>(m, "VertexNotFound", graph_error.ptr());
    py::register_exception<congraph::SizeLimitExceeded>(m, "SizeLimitExceeded", graph_error.ptr());

    m.def("init_logging", [](const std::string& level) {
        congraph::logging::init(spdlog::level::from_str(level));
    }, py::arg("level") = "warn");

    // ── GraphConfig ──
    py::class_<congraph::GraphConfig>(m, "GraphConfig")
        .def(py::init<>())
        .def_readwrite("planarity_limit", &congraph::GraphConfig::planarity_limit)
        .def_readwrite("parallel_results_threshold", &congraph::GraphConfig::parallel_results_threshold)
        .def_readwrite("max_workers", &congraph::GraphConfig::max_workers);

    // ── Edge ──
    py::class_<congraph::Edge<Label>>(m, "Edge")
        .def(py::init<Label, Label, double>(),
             py::arg("source"), py::arg("destination"), py::arg("weight") = 1.0)
        .def_property_readonly("source", &congraph::Edge<Label>::source)
        .def_property_readonly("destination", &congraph::Edge<Label>::destination)
        .def_property_readonly("weight", &congraph::Edge<Label>::weight)
        .def("is_loop", &congraph::Edge<Label>::isLoop)
        .def("__repr__", [](const congraph::Edge<Label>& e) { return congraph::describe(e); });

    // ── Vertex ──
    py::class_<congraph::Vertex<Label>>(m, "Vertex")
        .def(py::init<Label, double>(), py::arg("label"), py::arg("weight") = 1.0)
        .def_property_readonly("label", &congraph::Vertex<Label>::label)
        .def_property_readonly("weight", &congraph::Vertex<Label>::weight)
        .def("out_edges", &congraph::Vertex<Label>::outEdges)
        .def("get_edge_to", &congraph::Vertex<Label>::getEdgeTo)
        .def("__repr__", [](const congraph::Vertex<Label>& v) { return congraph::describe(v); });

    // ── SearchResult ──
    py::class_<congraph::SearchResult<Label>>(m, "SearchResult")
        .def_readonly("source", &congraph::SearchResult<Label>::source)
        .def_readonly("destination", &congraph::SearchResult<Label>::destination)
        .def_readonly("path", &congraph::SearchResult<Label>::path)
        .def_readonly("distance", &congraph::SearchResult<Label>::distance)
        .def("reachable", &congraph::SearchResult<Label>::reachable);

    // ── Graph ──
    py::class_<PyGraph>(m, "Graph")
        .def(py::init<congraph::GraphConfig>(), py::arg("config") = congraph::GraphConfig{})
        .def("add_vertex", &PyGraph::addVertex, py::arg("label"), py::arg("weight") = 0.0)
        .def("get_vertex", &PyGraph::getVertex)
        .def("has_vertex", &PyGraph::hasVertex)
        .def("delete_vertex", &PyGraph::deleteVertex)
        .def("get_vertices", &PyGraph::getVertices)
        .def("vertex_count", &PyGraph::vertexCount)
        .def("add_edge", &PyGraph::addEdge,
             py::arg("source"), py::arg("destination"), py::arg("weight") = 1.0)
        .def("get_edge", &PyGraph::getEdge)
        .def("has_edge", &PyGraph::hasEdge)
        .def("delete_edge", &PyGraph::deleteEdge)
        .def("get_edges", &PyGraph::getEdges)
        .def("get_simple_edges", &PyGraph::getSimpleEdges)
        .def("get_edges_from", &PyGraph::getEdgesFrom)
        .def("get_edges_to", &PyGraph::getEdgesTo)
        .def("edge_count", &PyGraph::edgeCount)
        .def("bfs", py::overload_cast<const Label&>(&PyGraph::bfs, py::const_),
             py::call_guard<py::gil_scoped_release>())
        .def("bfs", py::overload_cast<const Label&, const Label&>(&PyGraph::bfs, py::const_),
             py::call_guard<py::gil_scoped_release>())
        .def("dijkstra", py::overload_cast<const Label&>(&PyGraph::dijkstra, py::const_),
             py::call_guard<py::gil_scoped_release>())
        .def("dijkstra", py::overload_cast<const Label&, const Label&>(&PyGraph::dijkstra, py::const_),
             py::call_guard<py::gil_scoped_release>())
        .def("topological_sort", &PyGraph::topologicalSort)
        .def("is_acyclic", &PyGraph::isAcyclic)
        .def("is_connected", &PyGraph::isConnected)
        .def("is_strongly_connected", &PyGraph::isStronglyConnected)
        .def("connected_components", &PyGraph::connectedComponents)
        .def("strongly_connected_components", &PyGraph::stronglyConnectedComponents)
        .def("transpose", &PyGraph::transpose)
        .def("symmetric_closure", &PyGraph::symmetricClosure)
        .def("transitive_closure", &PyGraph::transitiveClosure)
        .def("induced_sub_graph", &PyGraph::inducedSubGraph)
        .def("is_complete", &PyGraph::isComplete)
        .def("is_bipartite", [](const PyGraph& g) {
            congraph::Bipartition<Label> partitions;
            bool bipartite = g.isBipartite(partitions);
            return py::make_tuple(bipartite, partitions.first, partitions.second);
        })
        .def("is_complete_bipartite", &PyGraph::isCompleteBipartite)
        .def("is_planar", &PyGraph::isPlanar, py::call_guard<py::gil_scoped_release>())
        .def("for_each_vertex", &PyGraph::forEachVertex)
        .def("for_each_edge", &PyGraph::forEachEdge)
        .def("config", &PyGraph::config)
        .def("set_config", &PyGraph::setConfig);
}

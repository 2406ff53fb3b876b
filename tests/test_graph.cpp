#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "util/logging.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace congraph;

using G = Graph<std::string>;

// ─── Basic Vertex/Edge CRUD ────────────────────────────────────

TEST(GraphTest, AddAndGetVertex) {
    G g;
    EXPECT_FALSE(g.hasVertex("a"));
    g.addVertex("a");
    ASSERT_TRUE(g.hasVertex("a"));
    auto v = g.getVertex("a");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->label(), "a");
    EXPECT_DOUBLE_EQ(v->weight(), 0.0);

    g.addVertex("b", 2.5);
    EXPECT_DOUBLE_EQ(g.getVertex("b")->weight(), 2.5);
    EXPECT_EQ(g.vertexCount(), 2u);
    EXPECT_FALSE(g.getVertex("zzz").has_value());
}

TEST(GraphTest, AddVertexOverwrites) {
    G g;
    g.addVertex("a", 1.0);
    g.addVertex("a", 5.0);
    EXPECT_EQ(g.vertexCount(), 1u);
    EXPECT_DOUBLE_EQ(g.getVertex("a")->weight(), 5.0);
}

TEST(GraphTest, ConstructFromSnapshot) {
    std::vector<Vertex<std::string>> vertices{Vertex<std::string>("a", 1.0),
                                              Vertex<std::string>("b", 2.0),
                                              Vertex<std::string>("c", 3.0)};
    std::vector<Edge<std::string>> edges{{"a", "b", 1.5}, {"b", "c", 2.5}, {"c", "a", 0.5}};
    G g(vertices, edges);

    EXPECT_EQ(g.vertexCount(), 3u);
    EXPECT_EQ(g.edgeCount(), 3u);
    EXPECT_DOUBLE_EQ(g.getVertex("b")->weight(), 2.0);
    EXPECT_DOUBLE_EQ(g.getEdge("b", "c")->weight(), 2.5);

    std::vector<Edge<std::string>> dangling{{"a", "x", 1.0}};
    EXPECT_THROW({ G bad(vertices, dangling); }, UnknownVertex);
}

TEST(GraphTest, ConstructFromLabels) {
    G g(std::vector<std::string>{"a", "b", "c"});
    EXPECT_EQ(g.vertexCount(), 3u);
    EXPECT_EQ(g.edgeCount(), 0u);
}

TEST(GraphTest, AddEdgeUnknownVertex) {
    G g;
    g.addVertex("a");
    EXPECT_THROW(g.addEdge("a", "b"), UnknownVertex);
    EXPECT_THROW(g.addEdge("b", "a"), UnknownVertex);
    EXPECT_EQ(g.edgeCount(), 0u);
}

TEST(GraphTest, AddEdgeOverwritesWeight) {
    G g;
    g.addVertex("a");
    g.addVertex("b");
    EXPECT_FALSE(g.addEdge("a", "b", 1.0));
    EXPECT_TRUE(g.addEdge("a", "b", 3.0));
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_DOUBLE_EQ(g.getEdge("a", "b")->weight(), 3.0);
    EXPECT_DOUBLE_EQ(g.getEdge("a", "b").value().weight(), 3.0);
}

TEST(GraphTest, DefaultEdgeWeightIsOne) {
    G g;
    g.addVertex("a");
    g.addVertex("b");
    g.addEdge("a", "b");
    EXPECT_DOUBLE_EQ(g.getEdge("a", "b")->weight(), 1.0);
}

TEST(GraphTest, GetAndDeleteEdge) {
    G g;
    g.addVertex("a");
    g.addVertex("b");
    g.addEdge("a", "b", 2.0);

    EXPECT_TRUE(g.hasEdge("a", "b"));
    EXPECT_FALSE(g.hasEdge("b", "a"));
    EXPECT_FALSE(g.getEdge("x", "a").has_value());

    auto removed = g.deleteEdge("a", "b");
    ASSERT_TRUE(removed.has_value());
    EXPECT_DOUBLE_EQ(removed->weight(), 2.0);
    EXPECT_FALSE(g.hasEdge("a", "b"));
    EXPECT_FALSE(g.deleteEdge("a", "b").has_value());
    EXPECT_FALSE(g.deleteEdge("x", "y").has_value());
}

TEST(GraphTest, DeleteVertexStripsIncidentEdges) {
    G g(std::vector<std::string>{"a", "b", "c", "d"});
    g.addEdge("a", "b");
    g.addEdge("b", "c");
    g.addEdge("c", "b");
    g.addEdge("d", "b");
    g.addEdge("b", "b");
    g.addEdge("a", "d");

    auto removed = g.deleteVertex("b");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->label(), "b");
    EXPECT_FALSE(g.hasVertex("b"));

    for (const auto& e : g.getEdges()) {
        EXPECT_NE(e.source(), "b");
        EXPECT_NE(e.destination(), "b");
    }
    EXPECT_EQ(g.edgeCount(), 1u);  // only a -> d survives
    EXPECT_TRUE(g.hasEdge("a", "d"));
    EXPECT_FALSE(g.deleteVertex("b").has_value());
}

TEST(GraphTest, EdgeQueries) {
    G g(std::vector<std::string>{"a", "b", "c"});
    g.addEdge("a", "b");
    g.addEdge("a", "c");
    g.addEdge("c", "b");
    g.addEdge("c", "c");

    EXPECT_EQ(g.getEdges().size(), 4u);
    EXPECT_EQ(g.getSimpleEdges().size(), 3u);
    EXPECT_EQ(g.getEdgesFrom("a").size(), 2u);
    EXPECT_EQ(g.getEdgesFrom("b").size(), 0u);
    EXPECT_EQ(g.getEdgesFrom("nope").size(), 0u);
    EXPECT_EQ(g.getEdgesTo("b").size(), 2u);
    EXPECT_EQ(g.getEdgesTo("c").size(), 2u);
    EXPECT_EQ(g.getEdgesTo("nope").size(), 0u);
}

TEST(GraphTest, GetVerticesReturnsCopies) {
    G g(std::vector<std::string>{"a", "b"});
    g.addEdge("a", "b");

    auto v = g.getVertex("a");
    v->addEdgeTo("a", 1.0);  // mutates the copy only
    EXPECT_FALSE(g.hasEdge("a", "a"));
    EXPECT_EQ(g.getVertices().size(), 2u);
}

TEST(GraphTest, CopyIsIndependent) {
    G g(std::vector<std::string>{"a", "b"});
    g.addEdge("a", "b");

    G copy = g;
    copy.addVertex("c");
    copy.deleteEdge("a", "b");

    EXPECT_EQ(g.vertexCount(), 2u);
    EXPECT_TRUE(g.hasEdge("a", "b"));
    EXPECT_EQ(copy.vertexCount(), 3u);
}

TEST(GraphTest, ForEach) {
    G g(std::vector<std::string>{"a", "b", "c"});
    g.addEdge("a", "b", 1.0);
    g.addEdge("b", "c", 2.0);

    int vertices = 0;
    g.forEachVertex([&](const Vertex<std::string>&) { vertices++; });
    double total = 0;
    g.forEachEdge([&](const Edge<std::string>& e) { total += e.weight(); });
    EXPECT_EQ(vertices, 3);
    EXPECT_DOUBLE_EQ(total, 3.0);
}

TEST(GraphTest, ForEachCallbackMayMutateGraph) {
    G g(std::vector<std::string>{"a", "b", "c"});
    g.addEdge("a", "b");

    auto done = std::async(std::launch::async, [&g] {
        g.forEachVertex([&g](const Vertex<std::string>& v) {
            g.addEdge(v.label(), "a");
            EXPECT_TRUE(g.hasVertex(v.label()));
        });
        g.forEachEdge([&g](const Edge<std::string>& e) {
            if (e.destination() == "b") g.deleteEdge(e.source(), e.destination());
        });
    });
    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    done.get();

    EXPECT_TRUE(g.hasEdge("a", "a"));
    EXPECT_TRUE(g.hasEdge("b", "a"));
    EXPECT_TRUE(g.hasEdge("c", "a"));
    EXPECT_FALSE(g.hasEdge("a", "b"));
}

TEST(GraphTest, ConfigIsInheritedByDerivedGraphs) {
    GraphConfig config;
    config.planarity_limit = 42;
    G g(config);
    g.addVertex("a");
    EXPECT_EQ(g.transpose().config().planarity_limit, 42u);
    EXPECT_EQ(g.symmetricClosure().config().planarity_limit, 42u);

    config.planarity_limit = 7;
    g.setConfig(config);
    EXPECT_EQ(g.config().planarity_limit, 7u);
}

TEST(GraphTest, DebugLoggingDoesNotChangeResults) {
    logging::init(spdlog::level::debug);
    G g(std::vector<std::string>{"a", "b"});
    g.addEdge("a", "b", 2.0);
    EXPECT_THROW(g.addEdge("a", "zzz"), UnknownVertex);
    EXPECT_DOUBLE_EQ(g.dijkstra("a", "b").distance, 2.0);
    g.deleteVertex("b");
    EXPECT_EQ(g.edgeCount(), 0u);
    logging::init();
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}

// ─── Factories ─────────────────────────────────────────────────

TEST(GraphTest, CompleteGraphFactory) {
    auto k4 = completeGraph(4);
    EXPECT_EQ(k4.vertexCount(), 4u);
    EXPECT_EQ(k4.edgeCount(), 12u);
    EXPECT_THROW(completeGraph(0), InvalidArgument);
}

TEST(GraphTest, CompleteBipartiteFactory) {
    auto k23 = completeBipartiteGraph(2, 3);
    EXPECT_EQ(k23.vertexCount(), 5u);
    EXPECT_EQ(k23.edgeCount(), 12u);
    EXPECT_TRUE(k23.hasEdge(1, 3));
    EXPECT_FALSE(k23.hasEdge(1, 2));
    EXPECT_THROW(completeBipartiteGraph(0, 2), InvalidArgument);
    EXPECT_THROW(completeBipartiteGraph(2, 0), InvalidArgument);
}

// ─── Concurrency ───────────────────────────────────────────────

TEST(GraphTest, ConcurrentWritersAndReaders) {
    Graph<int> g;
    const int writers = 4;
    const int per_writer = 200;

    std::atomic<bool> done{false};
    std::atomic<int> reads{0};

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; w++) {
        threads.emplace_back([&g, w] {
            int base = w * per_writer;
            for (int i = 0; i < per_writer; i++) {
                g.addVertex(base + i);
                if (i > 0) {
                    g.addEdge(base + i - 1, base + i, 1.0);
                }
            }
        });
    }
    for (int r = 0; r < 2; r++) {
        threads.emplace_back([&] {
            while (!done.load()) {
                // Every edge seen must point at a vertex that exists in the same snapshot
                Graph<int> snap = g;
                for (const auto& e : snap.getEdges()) {
                    EXPECT_TRUE(snap.hasVertex(e.source()));
                    EXPECT_TRUE(snap.hasVertex(e.destination()));
                }
                g.vertexCount();
                reads++;
            }
        });
    }

    for (int w = 0; w < writers; w++) {
        threads[w].join();
    }
    done = true;
    for (size_t t = writers; t < threads.size(); t++) {
        threads[t].join();
    }

    EXPECT_EQ(g.vertexCount(), static_cast<size_t>(writers * per_writer));
    EXPECT_EQ(g.edgeCount(), static_cast<size_t>(writers * (per_writer - 1)));
    EXPECT_GT(reads.load(), 0);
}

TEST(GraphTest, ConcurrentDeletesKeepIntegrity) {
    Graph<int> g = completeGraph(30);

    std::vector<std::thread> threads;
    for (int t = 0; t < 3; t++) {
        threads.emplace_back([&g, t] {
            for (int i = 1 + t; i <= 30; i += 3) {
                if (i % 2 == 0) g.deleteVertex(i);
            }
        });
    }
    threads.emplace_back([&g] {
        for (int i = 0; i < 50; i++) {
            auto results = g.bfs(1);
            EXPECT_EQ(results.at(1).distance, 0.0);
        }
    });
    for (auto& t : threads) t.join();

    EXPECT_EQ(g.vertexCount(), 15u);
    for (const auto& e : g.getEdges()) {
        EXPECT_TRUE(g.hasVertex(e.source()));
        EXPECT_TRUE(g.hasVertex(e.destination()));
    }
    EXPECT_TRUE(g.isComplete());
}

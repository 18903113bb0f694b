#include <catch2/catch.hpp>

#include "settree/v1/errors.hpp"
#include "settree/v1/graph.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace settree::v1;

namespace {

NodeKey key_of(const std::string& path) {
    if (path == "/") {
        return NodeKey{"", "/", -1};
    }
    const auto slash = path.rfind('/');
    return NodeKey{slash == 0 ? "/" : path.substr(0, slash), path.substr(slash + 1), -1};
}

DependencyGraph make_graph(const std::vector<std::string>& paths) {
    DependencyGraph graph;
    for (const auto& path : paths) {
        graph.add_vertex(path, key_of(path));
    }
    return graph;
}

std::string graph_error_code(const DependencyGraph& graph) {
    try {
        (void)graph.ordered_sccs();
    } catch (const GraphError& e) {
        return e.code();
    }
    return "";
}

using Sccs = std::vector<std::vector<std::string>>;

}  // namespace

TEST_CASE("v1 graph orders prerequisites first", "[v1][graph]") {
    auto graph = make_graph({"/", "/a", "/b", "/c"});
    graph.add_edge("/a", "/");
    graph.add_edge("/b", "/");
    graph.add_edge("/c", "/b");
    graph.add_edge("/c", "/a");

    CHECK(graph.size() == 4);
    CHECK(graph.edge_count() == 4);
    CHECK(graph.ordered_sccs() == Sccs{{"/"}, {"/a"}, {"/b"}, {"/c"}});
    CHECK(graph.depends_on("/c") == std::vector<std::string>{"/a", "/b"});
    CHECK(graph.required_by("/") == std::vector<std::string>{"/a", "/b"});
    CHECK(graph.depends_on("/") == std::vector<std::string>{});

    using Edge = std::pair<std::string, std::string>;
    CHECK(graph.edges() == std::vector<Edge>{{"/a", "/"}, {"/b", "/"}, {"/c", "/a"}, {"/c", "/b"}});
}

TEST_CASE("v1 graph components never depend on later components", "[v1][graph]") {
    auto graph = make_graph({"/", "/bus", "/bus/dev@1", "/bus/dev@2", "/intc", "/clk"});
    graph.add_edge("/bus", "/");
    graph.add_edge("/bus/dev@1", "/bus");
    graph.add_edge("/bus/dev@2", "/bus");
    graph.add_edge("/bus/dev@1", "/intc");
    graph.add_edge("/bus/dev@2", "/clk");
    graph.add_edge("/intc", "/");
    graph.add_edge("/clk", "/");
    graph.add_edge("/intc", "/clk");

    const auto sccs = graph.ordered_sccs();
    REQUIRE(sccs.size() == 6);
    std::vector<std::string> order;
    for (const auto& scc : sccs) {
        REQUIRE(scc.size() == 1);
        order.push_back(scc.front());
    }
    const auto position = [&](const std::string& path) {
        return std::find(order.begin(), order.end(), path) - order.begin();
    };
    for (const auto& [source, target] : graph.edges()) {
        INFO(source << " -> " << target);
        CHECK(position(target) < position(source));
    }
    CHECK(order.front() == "/");
}

TEST_CASE("v1 graph reports cycles as one component", "[v1][graph]") {
    auto graph = make_graph({"/a", "/b", "/c"});
    graph.add_edge("/a", "/b");
    graph.add_edge("/b", "/a");
    graph.add_edge("/c", "/a");

    const auto sccs = graph.ordered_sccs();
    REQUIRE(sccs.size() == 2);
    auto cycle = sccs.front();
    std::sort(cycle.begin(), cycle.end());
    CHECK(cycle == std::vector<std::string>{"/a", "/b"});
    CHECK(sccs.back() == std::vector<std::string>{"/c"});
}

TEST_CASE("v1 graph finds cycles no root reaches", "[v1][graph]") {
    auto graph = make_graph({"/r", "/x", "/y"});
    graph.add_edge("/x", "/y");
    graph.add_edge("/y", "/x");

    const auto sccs = graph.ordered_sccs();
    REQUIRE(sccs.size() == 2);
    CHECK(sccs.front() == std::vector<std::string>{"/r"});
    CHECK(sccs.back().size() == 2);
}

TEST_CASE("v1 graph without roots is an error", "[v1][graph]") {
    auto graph = make_graph({"/a", "/b"});
    graph.add_edge("/a", "/b");
    graph.add_edge("/b", "/a");
    CHECK(graph_error_code(graph) == kDiagNoRoots);

    CHECK(DependencyGraph().ordered_sccs().empty());
}

TEST_CASE("v1 graph ignores self edges and rejects unknown vertices", "[v1][graph]") {
    auto graph = make_graph({"/a"});
    graph.add_edge("/a", "/a");
    CHECK(graph.edge_count() == 0);
    CHECK(graph.ordered_sccs() == Sccs{{"/a"}});

    try {
        graph.add_edge("/a", "/missing");
        FAIL("expected GraphError");
    } catch (const GraphError& e) {
        CHECK(e.code() == kDiagUnknownVertex);
    }
    CHECK_THROWS_AS(graph.depends_on("/missing"), GraphError);
}

TEST_CASE("v1 graph vertices are unique per path", "[v1][graph]") {
    DependencyGraph graph;
    const auto first = graph.add_vertex("/a", key_of("/a"));
    CHECK(graph.add_vertex("/a", key_of("/a")) == first);
    CHECK(graph.size() == 1);
    CHECK(graph.contains("/a"));
    CHECK_FALSE(graph.contains("/b"));
}

TEST_CASE("v1 graph traversal can start from an explicit root", "[v1][graph]") {
    auto graph = make_graph({"/", "/a", "/z"});
    graph.add_edge("/a", "/");
    graph.set_root("/a");
    CHECK(graph.ordered_sccs() == Sccs{{"/"}, {"/a"}});
}

TEST_CASE("v1 graph handles very deep dependency chains", "[v1][graph]") {
    constexpr int kDepth = 200000;
    DependencyGraph graph;
    for (int i = 0; i < kDepth; ++i) {
        const std::string path = "/n" + std::to_string(i);
        graph.add_vertex(path, key_of(path));
        if (i > 0) {
            graph.add_edge(path, "/n" + std::to_string(i - 1));
        }
    }

    const auto sccs = graph.ordered_sccs();
    REQUIRE(sccs.size() == static_cast<std::size_t>(kDepth));
    CHECK(sccs.front() == std::vector<std::string>{"/n0"});
    CHECK(sccs.back() == std::vector<std::string>{"/n" + std::to_string(kDepth - 1)});
}

#pragma once

// =============================================================================
// settree - Dependency Graph
// =============================================================================
// Directed graph over merged entities, keyed by path. An edge (A, B) means A
// requires B to be initialized first. Tarjan's algorithm yields the strongly
// connected components in dependency order: no component depends on one that
// appears later in the list.
// =============================================================================

#include "settree/v1/node.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace settree::v1 {

class DependencyGraph {
public:
    using VertexId = std::size_t;

    /// Add a vertex; adding a known path again returns its id
    VertexId add_vertex(const std::string& path, NodeKey key);

    /// Add the edge source -> target. Self edges are ignored. Throws
    /// GraphError when either path is not a vertex.
    void add_edge(std::string_view source, std::string_view target);

    /// Restrict the traversal to what is reachable from 'path'
    void set_root(std::string_view path);

    [[nodiscard]] bool contains(std::string_view path) const;
    [[nodiscard]] std::size_t size() const noexcept { return vertices_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept;

    /// All edges as (source, target) paths, sorted by source then target key
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> edges() const;

    /// Strongly connected components in dependency order, as vertex paths.
    /// Throws GraphError for a non-empty graph without roots.
    [[nodiscard]] std::vector<std::vector<std::string>> ordered_sccs() const;

    /// Paths 'path' directly depends on, in key order
    [[nodiscard]] std::vector<std::string> depends_on(std::string_view path) const;
    /// Paths that directly depend on 'path', in key order
    [[nodiscard]] std::vector<std::string> required_by(std::string_view path) const;

private:
    struct Vertex {
        std::string path;
        NodeKey key;
        std::set<VertexId> out;
        std::set<VertexId> in;
    };

    [[nodiscard]] VertexId require(std::string_view path) const;
    [[nodiscard]] std::vector<VertexId> sorted(const std::set<VertexId>& ids) const;
    [[nodiscard]] std::vector<VertexId> roots() const;

    std::vector<Vertex> vertices_;
    std::map<std::string, VertexId, std::less<>> index_;
    std::optional<VertexId> root_;
};

}  // namespace settree::v1

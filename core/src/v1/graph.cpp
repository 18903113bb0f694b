#include "settree/v1/graph.hpp"
#include "settree/v1/errors.hpp"

#include <algorithm>

namespace settree::v1 {

namespace {

// Tarjan's strongly connected components over a graph given as sorted
// adjacency lists. Components are emitted after everything they reach, which
// is dependency order for edges pointing at prerequisites.
class TarjanState {
public:
    explicit TarjanState(const std::vector<std::vector<std::size_t>>& adjacency)
        : adjacency_(adjacency),
          index_(adjacency.size()),
          low_link_(adjacency.size(), 0),
          on_stack_(adjacency.size(), false) {}

    void follow(std::size_t root) {
        if (index_[root]) {
            return;
        }
        // Explicit frames keep deep trees off the call stack
        std::vector<Frame> frames;
        visit(root, frames);
        while (!frames.empty()) {
            Frame& frame = frames.back();
            const auto& targets = adjacency_[frame.vertex];
            if (frame.next < targets.size()) {
                const auto target = targets[frame.next++];
                if (!index_[target]) {
                    visit(target, frames);
                } else if (on_stack_[target]) {
                    low_link_[frame.vertex] = std::min(low_link_[frame.vertex], *index_[target]);
                }
                continue;
            }

            const auto vertex = frame.vertex;
            frames.pop_back();
            if (!frames.empty()) {
                const auto caller = frames.back().vertex;
                low_link_[caller] = std::min(low_link_[caller], low_link_[vertex]);
            }
            if (low_link_[vertex] == *index_[vertex]) {
                emit(vertex);
            }
        }
    }

    [[nodiscard]] bool visited(std::size_t id) const { return index_[id].has_value(); }
    [[nodiscard]] std::vector<std::vector<std::size_t>>& sccs() { return sccs_; }

private:
    struct Frame {
        std::size_t vertex;
        std::size_t next = 0;  // next adjacency entry to follow
    };

    void visit(std::size_t vertex, std::vector<Frame>& frames) {
        index_[vertex] = next_index_;
        low_link_[vertex] = next_index_;
        ++next_index_;
        stack_.push_back(vertex);
        on_stack_[vertex] = true;
        frames.push_back(Frame{vertex});
    }

    void emit(std::size_t root) {
        std::vector<std::size_t> scc;
        std::size_t member = 0;
        do {
            member = stack_.back();
            stack_.pop_back();
            on_stack_[member] = false;
            scc.push_back(member);
        } while (member != root);
        sccs_.push_back(std::move(scc));
    }

    const std::vector<std::vector<std::size_t>>& adjacency_;
    std::vector<std::optional<std::size_t>> index_;
    std::vector<std::size_t> low_link_;
    std::vector<bool> on_stack_;
    std::vector<std::size_t> stack_;
    std::size_t next_index_ = 0;
    std::vector<std::vector<std::size_t>> sccs_;
};

}  // namespace

DependencyGraph::VertexId DependencyGraph::add_vertex(const std::string& path, NodeKey key) {
    if (const auto it = index_.find(path); it != index_.end()) {
        return it->second;
    }
    const VertexId id = vertices_.size();
    vertices_.push_back(Vertex{path, std::move(key), {}, {}});
    index_.emplace(path, id);
    return id;
}

void DependencyGraph::add_edge(std::string_view source, std::string_view target) {
    const VertexId from = require(source);
    const VertexId to = require(target);
    if (from == to) {
        return;
    }
    vertices_[from].out.insert(to);
    vertices_[to].in.insert(from);
}

void DependencyGraph::set_root(std::string_view path) {
    root_ = require(path);
}

bool DependencyGraph::contains(std::string_view path) const {
    return index_.find(path) != index_.end();
}

std::size_t DependencyGraph::edge_count() const noexcept {
    std::size_t count = 0;
    for (const auto& vertex : vertices_) {
        count += vertex.out.size();
    }
    return count;
}

std::vector<std::pair<std::string, std::string>> DependencyGraph::edges() const {
    std::vector<std::pair<std::string, std::string>> result;
    std::vector<VertexId> all(vertices_.size());
    for (VertexId id = 0; id < all.size(); ++id) {
        all[id] = id;
    }
    std::sort(all.begin(), all.end(), [this](VertexId a, VertexId b) {
        return vertices_[a].key < vertices_[b].key;
    });
    for (const auto from : all) {
        for (const auto to : sorted(vertices_[from].out)) {
            result.emplace_back(vertices_[from].path, vertices_[to].path);
        }
    }
    return result;
}

std::vector<std::vector<std::string>> DependencyGraph::ordered_sccs() const {
    const auto start = root_ ? std::vector<VertexId>{*root_} : roots();
    if (!vertices_.empty() && start.empty()) {
        throw GraphError(kDiagNoRoots,
                         "no roots found in graph with " + std::to_string(vertices_.size()) + " vertices");
    }

    std::vector<std::vector<std::size_t>> adjacency;
    adjacency.reserve(vertices_.size());
    for (const auto& vertex : vertices_) {
        adjacency.push_back(sorted(vertex.out));
    }

    TarjanState tarjan(adjacency);
    for (const auto id : start) {
        tarjan.follow(id);
    }
    // Cycles no root reaches still have to be reported
    if (!root_) {
        std::vector<VertexId> rest;
        for (VertexId id = 0; id < vertices_.size(); ++id) {
            if (!tarjan.visited(id)) {
                rest.push_back(id);
            }
        }
        std::sort(rest.begin(), rest.end(), [this](VertexId a, VertexId b) {
            return vertices_[a].key < vertices_[b].key;
        });
        for (const auto id : rest) {
            tarjan.follow(id);
        }
    }

    std::vector<std::vector<std::string>> result;
    result.reserve(tarjan.sccs().size());
    for (const auto& scc : tarjan.sccs()) {
        std::vector<std::string> paths;
        paths.reserve(scc.size());
        for (const auto id : scc) {
            paths.push_back(vertices_[id].path);
        }
        result.push_back(std::move(paths));
    }
    return result;
}

std::vector<std::string> DependencyGraph::depends_on(std::string_view path) const {
    std::vector<std::string> result;
    for (const auto id : sorted(vertices_[require(path)].out)) {
        result.push_back(vertices_[id].path);
    }
    return result;
}

std::vector<std::string> DependencyGraph::required_by(std::string_view path) const {
    std::vector<std::string> result;
    for (const auto id : sorted(vertices_[require(path)].in)) {
        result.push_back(vertices_[id].path);
    }
    return result;
}

DependencyGraph::VertexId DependencyGraph::require(std::string_view path) const {
    const auto it = index_.find(path);
    if (it == index_.end()) {
        throw GraphError(kDiagUnknownVertex, "'" + std::string(path) + "' is not a vertex of the dependency graph");
    }
    return it->second;
}

std::vector<DependencyGraph::VertexId> DependencyGraph::sorted(const std::set<VertexId>& ids) const {
    std::vector<VertexId> result(ids.begin(), ids.end());
    std::sort(result.begin(), result.end(), [this](VertexId a, VertexId b) {
        return vertices_[a].key < vertices_[b].key;
    });
    return result;
}

std::vector<DependencyGraph::VertexId> DependencyGraph::roots() const {
    std::set<VertexId> ids;
    for (VertexId id = 0; id < vertices_.size(); ++id) {
        if (vertices_[id].in.empty()) {
            ids.insert(id);
        }
    }
    return sorted(ids);
}

}  // namespace settree::v1

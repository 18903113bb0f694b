#pragma once

// =============================================================================
// settree - Merged Settings Tree
// =============================================================================
// Merges the nodes of processed partial trees that share a path into one
// MergedEntity, derives the dependency graph, assigns dependency ordinals and
// builds the lookup tables consumers use:
//
//   Initial -> HasPartialTrees -> HasNodes -> HasOrdinals -> Processed
// =============================================================================

#include "settree/v1/diagnostics.hpp"
#include "settree/v1/graph.hpp"
#include "settree/v1/node.hpp"
#include "settree/v1/partial_tree.hpp"
#include "settree/v1/util.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace settree::v1 {

enum class SettingsTreeState : std::uint8_t {
    Initial,
    HasPartialTrees,
    HasNodes,
    HasOrdinals,
    Processed
};

[[nodiscard]] constexpr std::string_view to_string(SettingsTreeState state) noexcept {
    switch (state) {
        case SettingsTreeState::Initial: return "initial";
        case SettingsTreeState::HasPartialTrees: return "has_partial_trees";
        case SettingsTreeState::HasNodes: return "has_nodes";
        case SettingsTreeState::HasOrdinals: return "has_ordinals";
        case SettingsTreeState::Processed: return "processed";
    }
    return "unknown";
}

struct SettingsTreeOptions {
    VendorPrefixes vendor_prefixes;     // empty: vendor prefixes are not checked
    bool err_on_missing_vendor = false; // unknown vendor prefix is a SchemaError
};

/// The nodes of all sources that describe the same path
class MergedEntity {
public:
    explicit MergedEntity(const Node& first);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& name() const noexcept { return nodes_.front()->name(); }
    [[nodiscard]] const std::optional<std::string>& parent_path() const noexcept {
        return nodes_.front()->parent_path();
    }
    [[nodiscard]] const NodeKey& key() const noexcept { return nodes_.front()->key(); }

    /// Contributing nodes in source order
    [[nodiscard]] const std::vector<const Node*>& nodes() const noexcept { return nodes_; }
    /// Node contributed by one source kind, nullptr if that source has none
    [[nodiscard]] const Node* node_for(SourceKind kind) const;

    /// Union of the properties of all contributing nodes
    [[nodiscard]] const std::vector<const Property*>& properties() const noexcept { return properties_; }
    [[nodiscard]] const Property* find_property(std::string_view prop_name) const;

    [[nodiscard]] bool enabled() const noexcept { return nodes_.front()->enabled(); }
    /// True if any contributing node is read-only
    [[nodiscard]] bool read_only() const;
    /// Description of the most specific binding over all sources
    [[nodiscard]] std::optional<std::string> description() const;
    [[nodiscard]] bool has_child_binding() const;
    /// Position of 'child_path' among children(); throws PropertyError when
    /// it is not a child
    [[nodiscard]] std::size_t child_index(std::string_view child_path) const;
    [[nodiscard]] std::string z_path_id() const { return path_id(path_); }

    // Merged over all nodes, ordered, without duplicates
    [[nodiscard]] std::vector<std::string> children() const;
    [[nodiscard]] std::vector<std::string> labels() const;
    [[nodiscard]] std::vector<std::string> schemas() const;
    [[nodiscard]] std::vector<std::string> matching_schemas() const;
    [[nodiscard]] std::vector<BindingPtr> bindings() const;
    [[nodiscard]] std::vector<std::string> binding_paths() const;
    [[nodiscard]] std::vector<std::string> source_paths() const;

    /// Dependency ordinal; throws StateError before ordinals are assigned
    [[nodiscard]] int dep_ordinal() const;
    [[nodiscard]] bool has_dep_ordinal() const noexcept { return dep_ordinal_.has_value(); }

private:
    friend class SettingsTree;

    void add_node(const Node& node);
    void set_dep_ordinal(int ordinal);

    std::string path_;
    std::vector<const Node*> nodes_;
    std::vector<const Property*> properties_;
    std::optional<int> dep_ordinal_;
};

using EntityList = std::vector<const MergedEntity*>;

class SettingsTree final : public NodeLookup {
public:
    explicit SettingsTree(SettingsTreeOptions options = {});

    SettingsTree(const SettingsTree&) = delete;
    SettingsTree& operator=(const SettingsTree&) = delete;

    /// Add an unprocessed partial tree. Sources a later source refers to
    /// must be added first. Throws StateError once processing started, for
    /// a null tree, or for a second tree of the same kind.
    SettingsTree& add_source(std::unique_ptr<PartialTree> tree);

    /// Process every source, merge, order and index the entities. Runs once;
    /// throws StateError when called again or without sources.
    SettingsTree& process();

    [[nodiscard]] SettingsTreeState state() const noexcept { return state_; }
    [[nodiscard]] const SettingsTreeOptions& options() const noexcept { return options_; }
    [[nodiscard]] const Diagnostics& diagnostics() const noexcept { return diagnostics_; }

    [[nodiscard]] std::vector<const PartialTree*> sources() const;
    /// Source of one kind, nullptr if none was added
    [[nodiscard]] const PartialTree* source(SourceKind kind) const;

    // Entity queries (valid from HasNodes on)

    /// Entities in merge order
    [[nodiscard]] EntityList entities() const;
    [[nodiscard]] const MergedEntity* find(std::string_view path) const;
    /// Entity at 'path'; throws PropertyError when there is none
    [[nodiscard]] const MergedEntity& entity(std::string_view path) const;
    [[nodiscard]] const std::map<std::string, const MergedEntity*, std::less<>>& label2entity() const;
    [[nodiscard]] const std::map<std::string, const MergedEntity*, std::less<>>& path2entity() const;

    // Lookup tables (valid once Processed)

    [[nodiscard]] std::set<std::string> schemas() const;
    /// Enabled entities first, then disabled ones
    [[nodiscard]] const std::map<std::string, EntityList, std::less<>>& schema2entities() const;
    [[nodiscard]] const std::map<std::string, EntityList, std::less<>>& schema2enabled() const;
    [[nodiscard]] const std::map<std::string, EntityList, std::less<>>& schema2disabled() const;
    [[nodiscard]] const std::map<std::string, std::string, std::less<>>& schema2vendor() const;
    [[nodiscard]] const std::map<std::string, std::string, std::less<>>& schema2model() const;
    [[nodiscard]] const std::map<int, const MergedEntity*>& ordinal2entity() const;

    /// Strongly connected components in dependency order
    [[nodiscard]] std::vector<EntityList> ordered_sccs() const;
    [[nodiscard]] const DependencyGraph& graph() const;
    /// Entities 'entity' directly depends on
    [[nodiscard]] EntityList depends_on(const MergedEntity& entity) const;
    /// Entities that directly depend on 'entity'
    [[nodiscard]] EntityList required_by(const MergedEntity& entity) const;

    // NodeLookup
    [[nodiscard]] std::optional<std::string> path_for_label(std::string_view label) const override;
    [[nodiscard]] bool has_path(std::string_view path) const override;

private:
    void require_state(SettingsTreeState min, SettingsTreeState max = SettingsTreeState::Processed) const;
    [[nodiscard]] const MergedEntity& entity_at(std::string_view path) const;
    [[nodiscard]] EntityList to_entities(const std::vector<std::string>& paths) const;

    void merge_source(const PartialTree& tree);
    void rebuild_labels();
    void build_graph();
    void add_bound_edges(const MergedEntity& owner,
                         const MergedEntity& bound,
                         const std::vector<BindingPtr>& bindings);
    void add_reference_edges(const MergedEntity& owner, const Property& property);
    void assign_ordinals();
    void build_lookup_tables();
    void check_schema(const MergedEntity& entity, const std::string& schema);

    SettingsTreeOptions options_;
    SettingsTreeState state_ = SettingsTreeState::Initial;
    Diagnostics diagnostics_;

    std::vector<std::unique_ptr<PartialTree>> sources_;
    std::deque<MergedEntity> entities_;  // merge order
    std::map<std::string, MergedEntity*, std::less<>> index_;
    std::map<std::string, const MergedEntity*, std::less<>> path2entity_;
    std::map<std::string, EntityList, std::less<>> label_candidates_;
    std::map<std::string, const MergedEntity*, std::less<>> label2entity_;
    DependencyGraph graph_;
    std::vector<EntityList> ordered_sccs_;

    std::map<std::string, EntityList, std::less<>> schema2entities_;
    std::map<std::string, EntityList, std::less<>> schema2enabled_;
    std::map<std::string, EntityList, std::less<>> schema2disabled_;
    std::map<std::string, std::string, std::less<>> schema2vendor_;
    std::map<std::string, std::string, std::less<>> schema2model_;
    std::set<std::string, std::less<>> checked_schemas_;
    std::map<int, const MergedEntity*> ordinal2entity_;
};

}  // namespace settree::v1

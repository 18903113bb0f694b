#pragma once

// =============================================================================
// settree - Partial Trees
// =============================================================================
// A partial tree turns the raw nodes of one source into typed, validated
// Nodes. process() runs four stages once:
//
//   Unprocessed -> NodesBuilt -> CrossRefsResolved -> Checked
//
// Nodes are built parent before child (sorted by path depth), then property
// values are resolved in a second pass so references may point anywhere in
// the tree. Source specific behaviour lives in the DeviceTree and ConfigTree
// drivers.
// =============================================================================

#include "settree/v1/binding.hpp"
#include "settree/v1/diagnostics.hpp"
#include "settree/v1/node.hpp"
#include "settree/v1/raw_tree.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace settree::v1 {

enum class TreeState : std::uint8_t {
    Unprocessed,
    NodesBuilt,
    CrossRefsResolved,
    Checked
};

[[nodiscard]] constexpr std::string_view to_string(TreeState state) noexcept {
    switch (state) {
        case TreeState::Unprocessed: return "unprocessed";
        case TreeState::NodesBuilt: return "nodes_built";
        case TreeState::CrossRefsResolved: return "cross_refs_resolved";
        case TreeState::Checked: return "checked";
    }
    return "unknown";
}

/// Read access to the nodes merged before a partial tree is processed. Lets a
/// later source refer to nodes of an earlier one.
class NodeLookup {
public:
    virtual ~NodeLookup() = default;

    /// Path of the node carrying a unique label, nullopt if none
    [[nodiscard]] virtual std::optional<std::string> path_for_label(std::string_view label) const = 0;
    [[nodiscard]] virtual bool has_path(std::string_view path) const = 0;
};

class PartialTree {
public:
    virtual ~PartialTree() = default;

    PartialTree(const PartialTree&) = delete;
    PartialTree& operator=(const PartialTree&) = delete;

    [[nodiscard]] SourceKind kind() const noexcept { return raw_.kind(); }
    [[nodiscard]] const std::string& source_path() const noexcept { return raw_.source_path(); }
    [[nodiscard]] const RawTree& raw() const noexcept { return raw_; }
    [[nodiscard]] TreeState state() const noexcept { return state_; }

    /// Run all processing stages. 'merged' gives access to nodes of sources
    /// merged earlier. Throws StateError when called twice, SchemaError or
    /// PropertyError on invalid input.
    void process(const NodeLookup* merged = nullptr);

    // Queries, valid once the tree is Checked (StateError otherwise)

    /// Nodes in build order (parent before child)
    [[nodiscard]] std::vector<const Node*> nodes() const;
    [[nodiscard]] const Node* find(std::string_view path) const;
    /// Node at 'path'; throws PropertyError when there is none
    [[nodiscard]] const Node& node(std::string_view path) const;
    [[nodiscard]] const Node* node_by_label(std::string_view label) const;
    /// Bindings registered for this tree, keyed by (schema, bus variant);
    /// the variant is empty for variant-less bindings.
    [[nodiscard]] const std::map<std::pair<std::string, std::string>, BindingPtr>& bindings() const;

    [[nodiscard]] const Diagnostics& diagnostics() const noexcept { return diagnostics_; }
    [[nodiscard]] Diagnostics& diagnostics() noexcept { return diagnostics_; }

    /// Paths of nodes 'node' depends on for reasons only this source knows
    /// about (interrupt controllers for hardware nodes).
    [[nodiscard]] virtual std::vector<std::string> source_dependencies(const Node& node) const;

    // Resolution services used by the value conversion table while the
    // tree is processed

    /// Resolve a raw reference held by 'node' to a node path
    [[nodiscard]] virtual std::string resolve_reference(const Node& node,
                                                        std::string_view prop_name,
                                                        const RawValue& value) const = 0;
    /// Decode an indexed reference list. Throws PropertyError for sources
    /// without indexed references.
    [[nodiscard]] virtual IndexedRefList resolve_indexed_refs(const Node& node,
                                                              const PropertySpec& spec,
                                                              std::string_view prop_name,
                                                              const RawValue& value) const;

protected:
    PartialTree(RawTree raw, const std::vector<BindingPtr>& bindings);
    PartialTree(RawTree raw, const BindingDirectory& directory, const BindingOptions& options);

    /// Binding for (schema, variant) or nullptr
    [[nodiscard]] BindingPtr registered_binding(std::string_view schema, std::string_view variant = {}) const;

    [[nodiscard]] RawTree& mutable_raw() noexcept { return raw_; }
    [[nodiscard]] Node* mutable_node(std::string_view path);
    [[nodiscard]] const Node* node_in_progress(std::string_view path) const;
    [[nodiscard]] const NodeLookup* merged() const noexcept { return merged_; }
    /// Paths of nodes of this tree carrying 'label'
    [[nodiscard]] std::vector<std::string> paths_for_label(std::string_view label) const;

    // Driver hooks, called in this order for every node

    /// Source specific node set-up before bindings are matched
    virtual void prepare_node(Node& node) { (void)node; }
    /// Binding for one schema identifier of the node, nullptr if unknown
    [[nodiscard]] virtual BindingPtr find_binding(const Node& node, std::string_view schema) const;
    /// Binding to use for a node no schema matched, nullptr if none
    [[nodiscard]] virtual BindingPtr inferred_binding(const Node& node) const {
        (void)node;
        return nullptr;
    }
    /// Specs used for a node without bindings
    [[nodiscard]] virtual std::vector<const PropertySpec*> default_specs(const Node& node) const {
        (void)node;
        return {};
    }
    /// Enabled state of a node
    [[nodiscard]] virtual bool compute_enabled(const Node& node) const = 0;
    /// Label candidates offered to the merged label table
    [[nodiscard]] virtual std::vector<std::string> label_candidates(const Node& node) const = 0;
    /// True if a raw property not covered by any spec is still acceptable
    [[nodiscard]] virtual bool exempt_from_undeclared(const Node& node, std::string_view prop_name) const;
    /// Source specific data derived after properties are resolved
    virtual void finish_node(Node& node) { (void)node; }
    /// Final source specific validation
    virtual void check_node(const Node& node) { (void)node; }

private:
    void register_binding(const BindingPtr& binding);
    void require_checked() const;

    void build_nodes();
    void match_bindings(Node& node);
    void resolve_properties(Node& node);
    void resolve_property(Node& node, const PropertySpec& spec, const std::string& prop_name);
    void check_value(const Node& node, const PropertySpec& spec, const std::string& prop_name,
                     const PropertyValue& value) const;
    void check_undeclared(const Node& node) const;
    void check_enums();

    RawTree raw_;
    TreeState state_ = TreeState::Unprocessed;
    bool processing_ = false;
    const NodeLookup* merged_ = nullptr;
    std::map<std::pair<std::string, std::string>, BindingPtr> bindings_;
    std::deque<Node> nodes_;  // build order
    std::map<std::string, Node*, std::less<>> by_path_;
    std::map<std::string, std::vector<std::string>, std::less<>> by_label_;
    Diagnostics diagnostics_;
};

/// Schema identifiers named by a raw node's schema property (a string or a
/// list of strings). Throws PropertyError for other shapes.
[[nodiscard]] std::vector<std::string> raw_schemas(const RawTree& tree, const RawNode& node);

}  // namespace settree::v1

#include "settree/v1/settings_tree.hpp"
#include "settree/v1/errors.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <variant>

namespace settree::v1 {

namespace {

template <typename T>
void append_unique(std::vector<T>& out, const std::vector<T>& values) {
    for (const auto& value : values) {
        if (std::find(out.begin(), out.end(), value) == out.end()) {
            out.push_back(value);
        }
    }
}

std::string join_paths(const std::vector<std::string>& paths) {
    std::ostringstream out;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out << ", ";
        out << paths[i];
    }
    return out.str();
}

const std::regex& schema_id_regex() {
    static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9,+\-._]+$)");
    return re;
}

}  // namespace

// =============================================================================
// MergedEntity
// =============================================================================

MergedEntity::MergedEntity(const Node& first) : path_(first.path()) {
    add_node(first);
}

const Node* MergedEntity::node_for(SourceKind kind) const {
    for (const auto* node : nodes_) {
        if (node->kind() == kind) {
            return node;
        }
    }
    return nullptr;
}

const Property* MergedEntity::find_property(std::string_view prop_name) const {
    for (const auto* property : properties_) {
        if (property->name() == prop_name) {
            return property;
        }
    }
    return nullptr;
}

std::vector<std::string> MergedEntity::children() const {
    std::vector<std::string> out;
    for (const auto* node : nodes_) append_unique(out, node->children());
    return out;
}

std::vector<std::string> MergedEntity::labels() const {
    std::vector<std::string> out;
    for (const auto* node : nodes_) append_unique(out, node->labels());
    return out;
}

std::vector<std::string> MergedEntity::schemas() const {
    std::vector<std::string> out;
    for (const auto* node : nodes_) append_unique(out, node->schemas());
    return out;
}

std::vector<std::string> MergedEntity::matching_schemas() const {
    std::vector<std::string> out;
    for (const auto* node : nodes_) append_unique(out, node->matching_schemas());
    return out;
}

std::vector<BindingPtr> MergedEntity::bindings() const {
    std::vector<BindingPtr> out;
    for (const auto* node : nodes_) append_unique(out, node->bindings());
    return out;
}

std::vector<std::string> MergedEntity::binding_paths() const {
    std::vector<std::string> out;
    for (const auto* node : nodes_) append_unique(out, node->binding_paths());
    return out;
}

std::vector<std::string> MergedEntity::source_paths() const {
    std::vector<std::string> out;
    out.reserve(nodes_.size());
    for (const auto* node : nodes_) out.push_back(node->source_path());
    return out;
}

bool MergedEntity::read_only() const {
    return std::any_of(nodes_.begin(), nodes_.end(), [](const Node* node) { return node->read_only(); });
}

std::optional<std::string> MergedEntity::description() const {
    for (const auto* node : nodes_) {
        if (auto text = node->description()) {
            return text;
        }
    }
    return std::nullopt;
}

bool MergedEntity::has_child_binding() const {
    return std::any_of(nodes_.begin(), nodes_.end(), [](const Node* node) { return node->has_child_binding(); });
}

std::size_t MergedEntity::child_index(std::string_view child_path) const {
    const auto kids = children();
    const auto it = std::find(kids.begin(), kids.end(), child_path);
    if (it == kids.end()) {
        throw PropertyError(kDiagBadReference, "'" + std::string(child_path) + "' is not a child of " + path_);
    }
    return static_cast<std::size_t>(it - kids.begin());
}

int MergedEntity::dep_ordinal() const {
    if (!dep_ordinal_) {
        throw StateError(kDiagBadState, "dependency ordinal not set for node '" + path_ + "'");
    }
    return *dep_ordinal_;
}

void MergedEntity::add_node(const Node& node) {
    if (!nodes_.empty() && nodes_.front()->enabled() != node.enabled()) {
        throw MergeError(kDiagEnabledConflict,
                         "node '" + path_ + "' is " + (nodes_.front()->enabled() ? "enabled" : "disabled") +
                             " in '" + nodes_.front()->source_path() + "' but " +
                             (node.enabled() ? "enabled" : "disabled") + " in '" + node.source_path() + "'");
    }
    for (const auto& property : node.properties()) {
        if (find_property(property.name()) != nullptr) {
            throw MergeError(kDiagPropertyCollision,
                             "property '" + property.name() + "' of node '" + path_ + "' is set in '" +
                                 node.source_path() + "' and in another source");
        }
    }
    nodes_.push_back(&node);
    for (const auto& property : node.properties()) {
        properties_.push_back(&property);
    }
}

void MergedEntity::set_dep_ordinal(int ordinal) {
    if (dep_ordinal_) {
        throw StateError(kDiagBadState, "dependency ordinal of node '" + path_ + "' assigned twice");
    }
    dep_ordinal_ = ordinal;
}

// =============================================================================
// SettingsTree
// =============================================================================

SettingsTree::SettingsTree(SettingsTreeOptions options) : options_(std::move(options)) {
    if (options_.err_on_missing_vendor) {
        diagnostics_.escalate(WarningKind::VendorPrefix);
    }
}

SettingsTree& SettingsTree::add_source(std::unique_ptr<PartialTree> tree) {
    require_state(SettingsTreeState::Initial, SettingsTreeState::HasPartialTrees);
    if (!tree) {
        throw StateError(kDiagBadState, "cannot add a null partial tree");
    }
    if (source(tree->kind()) != nullptr) {
        throw StateError(kDiagBadState,
                         "a " + std::string(to_string(tree->kind())) + " source was already added");
    }
    if (tree->state() != TreeState::Unprocessed) {
        throw StateError(kDiagBadState, "partial tree '" + tree->source_path() + "' was already processed");
    }
    sources_.push_back(std::move(tree));
    state_ = SettingsTreeState::HasPartialTrees;
    return *this;
}

SettingsTree& SettingsTree::process() {
    require_state(SettingsTreeState::HasPartialTrees, SettingsTreeState::HasPartialTrees);

    for (const auto& tree : sources_) {
        tree->process(this);
        merge_source(*tree);
        rebuild_labels();
    }
    state_ = SettingsTreeState::HasNodes;

    build_graph();
    assign_ordinals();
    state_ = SettingsTreeState::HasOrdinals;

    build_lookup_tables();
    state_ = SettingsTreeState::Processed;
    return *this;
}

std::vector<const PartialTree*> SettingsTree::sources() const {
    std::vector<const PartialTree*> out;
    out.reserve(sources_.size());
    for (const auto& tree : sources_) out.push_back(tree.get());
    return out;
}

const PartialTree* SettingsTree::source(SourceKind kind) const {
    for (const auto& tree : sources_) {
        if (tree->kind() == kind) {
            return tree.get();
        }
    }
    return nullptr;
}

EntityList SettingsTree::entities() const {
    require_state(SettingsTreeState::HasNodes);
    EntityList out;
    out.reserve(entities_.size());
    for (const auto& entity : entities_) out.push_back(&entity);
    return out;
}

const MergedEntity* SettingsTree::find(std::string_view path) const {
    require_state(SettingsTreeState::HasNodes);
    const auto it = path2entity_.find(path);
    return it == path2entity_.end() ? nullptr : it->second;
}

const MergedEntity& SettingsTree::entity(std::string_view path) const {
    const auto* found = find(path);
    if (found == nullptr) {
        throw PropertyError(kDiagBadReference, "no node at path '" + std::string(path) + "'");
    }
    return *found;
}

const std::map<std::string, const MergedEntity*, std::less<>>& SettingsTree::label2entity() const {
    require_state(SettingsTreeState::HasNodes);
    return label2entity_;
}

const std::map<std::string, const MergedEntity*, std::less<>>& SettingsTree::path2entity() const {
    require_state(SettingsTreeState::HasNodes);
    return path2entity_;
}

std::set<std::string> SettingsTree::schemas() const {
    require_state(SettingsTreeState::Processed);
    std::set<std::string> out;
    for (const auto& [schema, entities] : schema2entities_) {
        out.insert(schema);
    }
    return out;
}

const std::map<std::string, EntityList, std::less<>>& SettingsTree::schema2entities() const {
    require_state(SettingsTreeState::Processed);
    return schema2entities_;
}

const std::map<std::string, EntityList, std::less<>>& SettingsTree::schema2enabled() const {
    require_state(SettingsTreeState::Processed);
    return schema2enabled_;
}

const std::map<std::string, EntityList, std::less<>>& SettingsTree::schema2disabled() const {
    require_state(SettingsTreeState::Processed);
    return schema2disabled_;
}

const std::map<std::string, std::string, std::less<>>& SettingsTree::schema2vendor() const {
    require_state(SettingsTreeState::Processed);
    return schema2vendor_;
}

const std::map<std::string, std::string, std::less<>>& SettingsTree::schema2model() const {
    require_state(SettingsTreeState::Processed);
    return schema2model_;
}

const std::map<int, const MergedEntity*>& SettingsTree::ordinal2entity() const {
    require_state(SettingsTreeState::Processed);
    return ordinal2entity_;
}

std::vector<EntityList> SettingsTree::ordered_sccs() const {
    require_state(SettingsTreeState::Processed);
    return ordered_sccs_;
}

const DependencyGraph& SettingsTree::graph() const {
    require_state(SettingsTreeState::HasOrdinals);
    return graph_;
}

EntityList SettingsTree::depends_on(const MergedEntity& entity) const {
    require_state(SettingsTreeState::HasOrdinals);
    return to_entities(graph_.depends_on(entity.path()));
}

EntityList SettingsTree::required_by(const MergedEntity& entity) const {
    require_state(SettingsTreeState::HasOrdinals);
    return to_entities(graph_.required_by(entity.path()));
}

std::optional<std::string> SettingsTree::path_for_label(std::string_view label) const {
    const auto it = label2entity_.find(label);
    if (it == label2entity_.end()) {
        return std::nullopt;
    }
    return it->second->path();
}

bool SettingsTree::has_path(std::string_view path) const {
    return path2entity_.find(path) != path2entity_.end();
}

void SettingsTree::require_state(SettingsTreeState min, SettingsTreeState max) const {
    if (state_ < min || state_ > max) {
        std::string expected(to_string(min));
        if (max != min) {
            expected += "..";
            expected += to_string(max);
        }
        throw StateError(kDiagBadState,
                         "settings tree should be in state '" + expected + "' but is in state '" +
                             std::string(to_string(state_)) + "'");
    }
}

const MergedEntity& SettingsTree::entity_at(std::string_view path) const {
    const auto it = path2entity_.find(path);
    if (it == path2entity_.end()) {
        throw GraphError(kDiagUnknownVertex, "no merged node at path '" + std::string(path) + "'");
    }
    return *it->second;
}

EntityList SettingsTree::to_entities(const std::vector<std::string>& paths) const {
    EntityList out;
    out.reserve(paths.size());
    for (const auto& path : paths) {
        out.push_back(&entity_at(path));
    }
    return out;
}

// =============================================================================
// Merging
// =============================================================================

void SettingsTree::merge_source(const PartialTree& tree) {
    for (const auto* node : tree.nodes()) {
        MergedEntity* entity = nullptr;
        if (const auto it = index_.find(node->path()); it != index_.end()) {
            entity = it->second;
            entity->add_node(*node);
        } else {
            entity = &entities_.emplace_back(*node);
            index_.emplace(node->path(), entity);
            path2entity_.emplace(node->path(), entity);
        }

        for (const auto& label : node->label_candidates()) {
            auto& owners = label_candidates_[label];
            if (std::find(owners.begin(), owners.end(), entity) == owners.end()) {
                owners.push_back(entity);
            }
        }
    }
}

void SettingsTree::rebuild_labels() {
    label2entity_.clear();
    for (const auto& [label, owners] : label_candidates_) {
        if (owners.size() == 1) {
            label2entity_.emplace(label, owners.front());
        }
    }
}

// =============================================================================
// Dependency graph
// =============================================================================

void SettingsTree::build_graph() {
    for (const auto& entity : entities_) {
        graph_.add_vertex(entity.path(), entity.key());
    }

    for (const auto& entity : entities_) {
        // Children depend on their parent
        for (const auto& child : entity.children()) {
            graph_.add_edge(child, entity.path());
        }
        add_bound_edges(entity, entity, entity.bindings());
    }
}

void SettingsTree::add_bound_edges(const MergedEntity& owner,
                                   const MergedEntity& bound,
                                   const std::vector<BindingPtr>& bindings) {
    for (const auto& binding : bindings) {
        for (const auto& spec : binding->specs()) {
            for (const auto* property : bound.properties()) {
                if (spec.matches(property->name())) {
                    add_reference_edges(owner, *property);
                }
            }
        }

        // Children typed by a child binding contribute their references to
        // the owner
        for (const auto& child_bindings : binding->child_bindings()) {
            for (const auto& child_path : bound.children()) {
                const auto& child = entity_at(child_path);
                if (child_bindings.matches(child.name())) {
                    add_bound_edges(owner, child, child_bindings.bindings);
                }
            }
        }
    }

    for (const auto* node : bound.nodes()) {
        const auto* tree = source(node->kind());
        for (const auto& dependency : tree->source_dependencies(*node)) {
            graph_.add_edge(owner.path(), dependency);
        }
    }
}

void SettingsTree::add_reference_edges(const MergedEntity& owner, const Property& property) {
    switch (property.tag()) {
        case TypeTag::NodeRef:
            if (const auto* ref = std::get_if<NodeRef>(&property.value())) {
                graph_.add_edge(owner.path(), ref->path);
            }
            break;
        case TypeTag::NodeRefList:
            if (const auto* refs = std::get_if<std::vector<NodeRef>>(&property.value())) {
                for (const auto& ref : *refs) {
                    graph_.add_edge(owner.path(), ref.path);
                }
            }
            break;
        case TypeTag::IndexedRefs:
            if (const auto* entries = std::get_if<IndexedRefList>(&property.value())) {
                for (const auto& entry : *entries) {
                    if (entry) {
                        graph_.add_edge(owner.path(), entry->controller);
                    }
                }
            }
            break;
        default:
            break;
    }
}

void SettingsTree::assign_ordinals() {
    const auto sccs = graph_.ordered_sccs();

    // A loop anywhere leaves every ordinal unassigned
    for (const auto& scc : sccs) {
        if (scc.size() > 1) {
            auto members = scc;
            std::sort(members.begin(), members.end());
            throw GraphError(kDiagDependencyLoop, "dependency loop detected: " + join_paths(members));
        }
    }

    int ordinal = 0;
    ordered_sccs_.clear();
    ordered_sccs_.reserve(sccs.size());
    for (const auto& scc : sccs) {
        index_.at(scc.front())->set_dep_ordinal(ordinal++);
        ordered_sccs_.push_back(to_entities(scc));
    }
}

// =============================================================================
// Lookup tables
// =============================================================================

void SettingsTree::build_lookup_tables() {
    for (const auto& entity : entities_) {
        for (const auto& schema : entity.schemas()) {
            if (entity.enabled()) {
                schema2enabled_[schema].push_back(&entity);
            } else {
                schema2disabled_[schema].push_back(&entity);
            }
            check_schema(entity, schema);
        }
    }

    for (const auto& [schema, entities] : schema2enabled_) {
        auto& all = schema2entities_[schema];
        all.insert(all.end(), entities.begin(), entities.end());
    }
    for (const auto& [schema, entities] : schema2disabled_) {
        auto& all = schema2entities_[schema];
        all.insert(all.end(), entities.begin(), entities.end());
    }

    for (const auto& scc : ordered_sccs_) {
        ordinal2entity_.emplace(scc.front()->dep_ordinal(), scc.front());
    }
}

void SettingsTree::check_schema(const MergedEntity& entity, const std::string& schema) {
    if (schema2vendor_.find(schema) != schema2vendor_.end()) {
        return;
    }
    if (checked_schemas_.insert(schema).second && !std::regex_match(schema, schema_id_regex())) {
        throw SchemaError(kDiagBadSchemaId,
                          "node '" + entity.path() + "' schema '" + schema +
                              "' must match this regular expression: '^[a-zA-Z][a-zA-Z0-9,+\\-._]+$'");
    }

    const auto comma = schema.find(',');
    if (comma == std::string::npos || options_.vendor_prefixes.empty()) {
        return;
    }
    const std::string vendor = schema.substr(0, comma);
    if (const auto it = options_.vendor_prefixes.find(vendor); it != options_.vendor_prefixes.end()) {
        schema2vendor_.emplace(schema, it->second);
        schema2model_.emplace(schema, schema.substr(comma + 1));
    } else if (entity.path() != "/") {
        // The root node may use any schema
        diagnostics_.warn(WarningKind::VendorPrefix, kDiagVendorPrefix,
                          "node '" + entity.path() + "' schema '" + schema + "' has unknown vendor prefix '" +
                              vendor + "'");
    }
}

}  // namespace settree::v1

#include "settree/v1/partial_tree.hpp"
#include "settree/v1/errors.hpp"

#include "value_conversion.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <type_traits>
#include <variant>

namespace settree::v1 {

namespace {

// Schema identifiers a raw tree uses, for deciding which binding files to load
std::set<std::string, std::less<>> used_schemas(const RawTree& tree) {
    std::set<std::string, std::less<>> schemas;
    for (const auto& node : tree.nodes()) {
        const RawValue* value = node.find(tree.schema_property());
        if (value == nullptr) {
            continue;
        }
        if (value->is(RawKind::String)) {
            schemas.insert(value->text);
        } else if (value->is(RawKind::List)) {
            for (const auto& item : value->items) {
                if (item.is(RawKind::String)) {
                    schemas.insert(item.text);
                }
            }
        }
    }
    return schemas;
}

std::optional<std::string> declared_schema(const std::filesystem::path& file, SourceKind kind) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(file.string());
    } catch (const YAML::Exception& e) {
        throw SchemaError(kDiagYamlSyntax, "could not parse " + file.string() + ": " + e.what());
    }
    if (!doc.IsMap()) {
        return std::nullopt;
    }
    const YAML::Node& const_doc = doc;
    YAML::Node key = const_doc["schema"];
    if (!key && kind == SourceKind::Hardware) {
        key = const_doc["compatible"];
    }
    if (!key || !key.IsScalar()) {
        return std::nullopt;
    }
    return key.Scalar();
}

std::string describe_enum(const std::vector<EnumValue>& values) {
    std::ostringstream out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        out << (i == 0 ? "" : ", ");
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    out << "'" << v << "'";
                } else if constexpr (std::is_same_v<T, bool>) {
                    out << (v ? "true" : "false");
                } else {
                    out << v;
                }
            },
            values[i]);
    }
    return out.str();
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::vector<std::string> raw_schemas(const RawTree& tree, const RawNode& node) {
    const RawValue* value = node.find(tree.schema_property());
    if (value == nullptr) {
        return {};
    }
    if (value->is(RawKind::String)) {
        return {value->text};
    }
    if (value->is_list_of(RawKind::String)) {
        std::vector<std::string> schemas;
        schemas.reserve(value->items.size());
        for (const auto& item : value->items) {
            schemas.push_back(item.text);
        }
        return schemas;
    }
    throw PropertyError(kDiagTypeMismatch, "'" + tree.schema_property() + "' on " + node.path + " in " +
                                               tree.source_path() + " should be a string or a list of strings, not " +
                                               value->describe());
}

// =============================================================================
// Construction and binding registry
// =============================================================================

PartialTree::PartialTree(RawTree raw, const std::vector<BindingPtr>& bindings) : raw_(std::move(raw)) {
    for (const auto& binding : bindings) {
        register_binding(binding);
    }
}

PartialTree::PartialTree(RawTree raw, const BindingDirectory& directory, const BindingOptions& options)
    : raw_(std::move(raw)) {
    const auto schemas = used_schemas(raw_);
    for (const auto& file : directory.files()) {
        const auto schema = declared_schema(file, kind());
        if (!schema || schemas.find(*schema) == schemas.end()) {
            continue;
        }
        register_binding(Binding::load(file, kind(), directory, options));
    }
}

void PartialTree::register_binding(const BindingPtr& binding) {
    if (binding->kind() != kind()) {
        throw SchemaError(kDiagDuplicateBinding, "binding " + binding->path() + " is a " +
                                                     std::string(to_string(binding->kind())) +
                                                     " binding and cannot be used for " + source_path());
    }
    if (binding->schema()) {
        auto key = std::make_pair(*binding->schema(), binding->on_bus().value_or(""));
        const auto [it, inserted] = bindings_.emplace(key, binding);
        if (!inserted && it->second != binding) {
            std::string what = "schema '" + key.first + "'";
            if (!key.second.empty()) {
                what += " on bus '" + key.second + "'";
            }
            throw SchemaError(kDiagDuplicateBinding, "both " + it->second->path() + " and " + binding->path() +
                                                         " have " + what);
        }
    }
    for (const auto& child : binding->child_bindings()) {
        for (const auto& child_binding : child.bindings) {
            if (child_binding->schema()) {
                register_binding(child_binding);
            }
        }
    }
}

BindingPtr PartialTree::registered_binding(std::string_view schema, std::string_view variant) const {
    const auto it = bindings_.find(std::make_pair(std::string(schema), std::string(variant)));
    return it != bindings_.end() ? it->second : nullptr;
}

BindingPtr PartialTree::find_binding(const Node& node, std::string_view schema) const {
    (void)node;
    return registered_binding(schema);
}

// =============================================================================
// Processing
// =============================================================================

void PartialTree::process(const NodeLookup* merged) {
    if (state_ != TreeState::Unprocessed || processing_) {
        throw StateError(kDiagBadState, "partial tree for " + source_path() + " has already been processed");
    }
    processing_ = true;
    merged_ = merged;

    build_nodes();
    state_ = TreeState::NodesBuilt;

    for (auto& node : nodes_) {
        resolve_properties(node);
    }
    for (auto& node : nodes_) {
        finish_node(node);
    }
    state_ = TreeState::CrossRefsResolved;

    for (const auto& node : nodes_) {
        check_node(node);
    }
    check_enums();
    merged_ = nullptr;
    state_ = TreeState::Checked;
}

void PartialTree::build_nodes() {
    std::vector<const RawNode*> order;
    order.reserve(raw_.nodes().size());
    for (const auto& raw : raw_.nodes()) {
        order.push_back(&raw);
    }
    std::stable_sort(order.begin(), order.end(), [](const RawNode* a, const RawNode* b) {
        return path_depth(a->path) < path_depth(b->path);
    });

    for (const RawNode* raw : order) {
        Node& node = nodes_.emplace_back(kind(), *raw, source_path());
        by_path_.emplace(node.path(), &node);
    }

    for (auto& node : nodes_) {
        prepare_node(node);
        match_bindings(node);
        node.set_enabled(compute_enabled(node));
        node.set_label_candidates(label_candidates(node));
        for (const auto& label : node.label_candidates()) {
            by_label_[label].push_back(node.path());
        }
    }
}

void PartialTree::match_bindings(Node& node) {
    node.set_schemas(raw_schemas(raw_, node.raw()));
    for (const auto& schema : node.schemas()) {
        if (BindingPtr binding = find_binding(node, schema)) {
            node.add_binding(std::move(binding), schema);
        }
    }

    if (node.parent_path()) {
        const Node* parent = node_in_progress(*node.parent_path());
        if (parent != nullptr) {
            for (const auto& parent_binding : parent->bindings()) {
                for (auto& child : parent_binding->child_bindings_for(node.name())) {
                    const auto& have = node.bindings();
                    if (std::find(have.begin(), have.end(), child) == have.end()) {
                        node.add_binding(std::move(child), std::nullopt);
                    }
                }
            }
        }
    }

    if (node.bindings().empty()) {
        if (BindingPtr inferred = inferred_binding(node)) {
            node.add_binding(std::move(inferred), std::nullopt);
        }
    }

    // Later bindings are less specific; walk them first so earlier ones win
    std::vector<const PropertySpec*> specs;
    const auto& bindings = node.bindings();
    for (auto it = bindings.rbegin(); it != bindings.rend(); ++it) {
        for (const auto& spec : (*it)->specs()) {
            auto same = std::find_if(specs.begin(), specs.end(),
                                     [&](const PropertySpec* s) { return s->name() == spec.name(); });
            if (same != specs.end()) {
                *same = &spec;
            } else {
                specs.push_back(&spec);
            }
        }
    }
    if (bindings.empty()) {
        specs = default_specs(node);
    }
    node.set_specs(std::move(specs));
}

void PartialTree::resolve_properties(Node& node) {
    std::set<std::string, std::less<>> done;
    for (const PropertySpec* spec : node.specs()) {
        if (!spec->is_pattern()) {
            resolve_property(node, *spec, spec->name());
            done.insert(spec->name());
        }
    }
    for (const PropertySpec* spec : node.specs()) {
        if (!spec->is_pattern()) {
            continue;
        }
        for (const auto& raw_prop : node.raw().properties) {
            if (done.find(raw_prop.name) == done.end() && spec->matches(raw_prop.name)) {
                resolve_property(node, *spec, raw_prop.name);
                done.insert(raw_prop.name);
            }
        }
    }
    check_undeclared(node);
}

void PartialTree::resolve_property(Node& node, const PropertySpec& spec, const std::string& prop_name) {
    const RawValue* raw = node.raw().find(prop_name);
    if (raw == nullptr) {
        if (spec.required() && node.enabled()) {
            throw PropertyError(kDiagRequiredMissing, "'" + prop_name + "' is marked as required in 'properties:' in " +
                                                          spec.path() + ", but does not appear in " + node.path() +
                                                          " in " + source_path());
        }
        if (spec.default_value()) {
            node.add_property(Property(spec, prop_name, *spec.default_value(), node.path()));
        } else if (spec.tag() == TypeTag::Boolean) {
            node.add_property(Property(spec, prop_name, false, node.path()));
        }
        return;
    }

    if (spec.deprecated()) {
        diagnostics_.warn(WarningKind::DeprecatedProperty, kDiagDeprecatedProperty,
                          "'" + prop_name + "' is marked as deprecated in 'properties:' in " + spec.path() +
                              " for node " + node.path() + ".");
    }

    PropertyValue value = detail::convert_raw_value(detail::ConversionContext{*this, node, spec, prop_name}, *raw);
    check_value(node, spec, prop_name, value);

    // Cell counts and translation maps are consumed while resolving other
    // properties and are not exposed as values
    if (prop_name.front() == '#' || ends_with(prop_name, "-map")) {
        return;
    }
    node.add_property(Property(spec, prop_name, std::move(value), node.path()));
}

void PartialTree::check_value(const Node& node, const PropertySpec& spec, const std::string& prop_name,
                              const PropertyValue& value) const {
    if (const auto& allowed = spec.enum_values()) {
        for (const auto& part : scalar_parts(value)) {
            const bool found = std::any_of(allowed->begin(), allowed->end(),
                                           [&](const EnumValue& entry) { return enum_matches(entry, part); });
            if (!found) {
                throw PropertyError(kDiagEnumViolation, "value of property '" + prop_name + "' on " + node.path() + " in " +
                                                   source_path() + " (" + describe(value) +
                                                   ") is not in 'enum' list in " + spec.path() + " (" +
                                                   describe_enum(*allowed) + ")");
            }
        }
    }
    if (const auto& expected = spec.const_value(); expected && *expected != value) {
        throw PropertyError(kDiagConstViolation, "value of property '" + prop_name + "' on " + node.path() + " in " +
                                            source_path() + " (" + describe(value) +
                                            ") is different from the 'const' value specified in " + spec.path() +
                                            " (" + describe(*expected) + ")");
    }
}

void PartialTree::check_undeclared(const Node& node) const {
    // Nodes typed only by the default specs accept anything
    if (node.bindings().empty() || node.specs().empty()) {
        return;
    }
    for (const auto& raw_prop : node.raw().properties) {
        const bool declared = std::any_of(node.specs().begin(), node.specs().end(),
                                          [&](const PropertySpec* spec) { return spec->matches(raw_prop.name); });
        if (declared || exempt_from_undeclared(node, raw_prop.name)) {
            continue;
        }
        std::string where;
        for (const auto& path : node.binding_paths()) {
            where += (where.empty() ? "" : ", ") + path;
        }
        throw PropertyError(kDiagUndeclaredProperty, "'" + raw_prop.name + "' appears in " + node.path() + " in " +
                                                         source_path() + ", but is not declared in 'properties:' in " +
                                                         where);
    }
}

bool PartialTree::exempt_from_undeclared(const Node& node, std::string_view prop_name) const {
    (void)node;
    return prop_name == raw_.schema_property() || prop_name == raw_.enabled_property();
}

void PartialTree::check_enums() {
    for (const auto& [key, binding] : bindings_) {
        for (const auto& spec : binding->specs()) {
            if (!spec.enum_values() || spec.tag() != TypeTag::String) {
                continue;
            }
            const std::string where = "schema '" + key.first + "' in binding '" + binding->path() +
                                      "' has enum for property '" + spec.name() + "'";
            if (!spec.enum_tokenizable()) {
                diagnostics_.warn(WarningKind::EnumTokenizable, kDiagEnumNotTokenizable,
                                  where + " that is not tokenizable");
            } else if (!spec.enum_upper_tokenizable()) {
                diagnostics_.warn(WarningKind::EnumTokenizable, kDiagEnumLowercaseOnly,
                                  where + " that is only tokenizable in lowercase");
            }
        }
    }
}

// =============================================================================
// Lookups
// =============================================================================

void PartialTree::require_checked() const {
    if (state_ != TreeState::Checked) {
        throw StateError(kDiagBadState, "partial tree for " + source_path() + " is " +
                                         std::string(to_string(state_)) + ", process() it first");
    }
}

std::vector<const Node*> PartialTree::nodes() const {
    require_checked();
    std::vector<const Node*> out;
    out.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        out.push_back(&node);
    }
    return out;
}

const Node* PartialTree::find(std::string_view path) const {
    require_checked();
    return node_in_progress(path);
}

const Node& PartialTree::node(std::string_view path) const {
    const Node* found = find(path);
    if (found == nullptr) {
        throw PropertyError(kDiagBadReference, "no node '" + std::string(path) + "' in " + source_path());
    }
    return *found;
}

const Node* PartialTree::node_by_label(std::string_view label) const {
    require_checked();
    const auto paths = paths_for_label(label);
    return paths.size() == 1 ? node_in_progress(paths.front()) : nullptr;
}

const std::map<std::pair<std::string, std::string>, BindingPtr>& PartialTree::bindings() const {
    require_checked();
    return bindings_;
}

Node* PartialTree::mutable_node(std::string_view path) {
    const auto it = by_path_.find(path);
    return it != by_path_.end() ? it->second : nullptr;
}

const Node* PartialTree::node_in_progress(std::string_view path) const {
    const auto it = by_path_.find(path);
    return it != by_path_.end() ? it->second : nullptr;
}

std::vector<std::string> PartialTree::paths_for_label(std::string_view label) const {
    const auto it = by_label_.find(label);
    return it != by_label_.end() ? it->second : std::vector<std::string>{};
}

std::vector<std::string> PartialTree::source_dependencies(const Node& node) const {
    (void)node;
    return {};
}

IndexedRefList PartialTree::resolve_indexed_refs(const Node& node,
                                                 const PropertySpec& spec,
                                                 std::string_view prop_name,
                                                 const RawValue& value) const {
    (void)spec;
    (void)value;
    throw PropertyError(kDiagTypeMismatch, "property '" + std::string(prop_name) + "' on " + node.path() +
                                               ": indexed references are not supported in " +
                                               std::string(to_string(kind())) + " sources");
}

}  // namespace settree::v1

#include "settree/v1/binding.hpp"
#include "settree/v1/errors.hpp"

#include "yaml_scalar.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

namespace settree::v1 {

namespace {

using detail::yaml_inline;

constexpr const char* kAllowlistKey = "property-allowlist";
constexpr const char* kBlocklistKey = "property-blocklist";
constexpr const char* kChildBindingKey = "child-binding";

YAML::Node get(const YAML::Node& map, const std::string& key) {
    return map[key];
}

bool is_child_node_spec(const YAML::Node& prop) {
    if (!prop.IsMap()) {
        return false;
    }
    const YAML::Node type = get(prop, "type");
    return type && type.IsScalar() && type.Scalar() == "node";
}

std::vector<std::string> map_keys(const YAML::Node& map) {
    std::vector<std::string> keys;
    if (map && map.IsMap()) {
        for (const auto& entry : map) {
            keys.push_back(entry.first.as<std::string>());
        }
    }
    return keys;
}

bool contains(const std::vector<std::string>& items, std::string_view value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

/// Full match of a property name (used as a pattern) against a key
bool pattern_matches(const std::string& pattern, const std::string& key) {
    if (pattern == key) {
        return true;
    }
    if (!looks_like_pattern(pattern)) {
        return false;
    }
    try {
        return std::regex_match(key, std::regex(pattern, std::regex::ECMAScript));
    } catch (const std::regex_error&) {
        // Invalid patterns are reported when the property spec is parsed
        return false;
    }
}

YAML::Node parse_document(const std::string& text, const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw SchemaError(kDiagYamlSyntax, path + ": " + e.what());
    }
    if (!doc.IsMap()) {
        throw SchemaError(kDiagTypeMismatch, path + ": invalid contents, expected a mapping");
    }
    return doc;
}

NameList read_name_list(const YAML::Node& node, const std::string& key, const std::string& path) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsSequence()) {
        throw SchemaError(kDiagIncludeFilter,
                          "'" + key + "' value " + yaml_inline(node) + " in " + path + " should be a list");
    }
    std::vector<std::string> names;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw SchemaError(kDiagIncludeFilter,
                              "'" + key + "' value " + yaml_inline(node) + " in " + path + " should be a list of names");
        }
        names.push_back(item.Scalar());
    }
    return names;
}

/// Resolves the 'include:' directives of one binding document.
class IncludeExpander {
public:
    IncludeExpander(std::string binding_path, const IncludeResolver& resolver, const BindingOptions& options)
        : binding_path_(std::move(binding_path)), resolver_(resolver), options_(options) {}

    /// Name -> document that declared the property last
    using SpecOrigins = std::map<std::string, std::string>;

    /// Turn a legacy 'child-binding:' block into a ".*" property of type
    /// node, recursively.
    void normalize_child_binding(YAML::Node doc) const {
        const YAML::Node child = get(doc, kChildBindingKey);
        if (!child) {
            return;
        }
        if (!child.IsMap()) {
            throw SchemaError(kDiagTypeMismatch, "malformed 'child-binding:' in " + binding_path_ +
                                                     ", expected a binding (dictionary with keys/values)");
        }
        YAML::Node child_yaml = YAML::Clone(child);
        doc.remove(kChildBindingKey);
        normalize_child_binding(child_yaml);
        child_yaml["type"] = "node";
        if (!get(doc, "properties")) {
            doc["properties"] = YAML::Node(YAML::NodeType::Map);
        }
        doc["properties"][".*"] = child_yaml;
    }

    /// Merge every include of 'doc' into it, depth first.
    void expand(YAML::Node doc,
                const std::string& doc_path,
                const NameList& allowlist,
                const NameList& blocklist,
                SpecOrigins& origins) const {
        std::vector<std::string> own_names;
        const YAML::Node props = get(doc, "properties");
        if (props && props.IsMap()) {
            for (const auto& entry : props) {
                if (is_child_node_spec(entry.second)) {
                    SpecOrigins child_origins;
                    expand(entry.second, doc_path, allowlist, blocklist, child_origins);
                } else {
                    own_names.push_back(entry.first.as<std::string>());
                }
            }
        }

        const YAML::Node includes = get(doc, "include");
        if (includes) {
            YAML::Node elements = YAML::Clone(includes);
            doc.remove("include");
            if (elements.IsScalar()) {
                YAML::Node list(YAML::NodeType::Sequence);
                list.push_back(elements);
                elements = list;
            } else if (!elements.IsSequence()) {
                throw SchemaError(kDiagTypeMismatch, "'include:' in " + doc_path +
                                                         " should be a string or list, but has type " +
                                                         detail::yaml_node_class(elements));
            }

            YAML::Node merged(YAML::NodeType::Map);
            for (const auto& element : elements) {
                merge_yaml(merged, include_one(element, doc_path, allowlist, blocklist, origins), false, "");
            }
            merge_yaml(doc, merged, true, "");
        }

        for (const auto& name : own_names) {
            origins[name] = doc_path;
        }
    }

private:
    YAML::Node include_one(const YAML::Node& element,
                           const std::string& doc_path,
                           const NameList& allowlist,
                           const NameList& blocklist,
                           SpecOrigins& origins) const {
        std::optional<std::string> name;
        NameList merged_allowlist = allowlist;
        NameList merged_blocklist = blocklist;
        YAML::Node child_filter;

        if (element.IsScalar()) {
            name = element.Scalar();
        } else if (element.IsMap()) {
            std::vector<std::string> unexpected;
            for (const auto& entry : element) {
                const std::string key = entry.first.as<std::string>();
                if (key == "name") {
                    name = entry.second.IsScalar() ? entry.second.Scalar() : yaml_inline(entry.second);
                } else if (key == kAllowlistKey) {
                    merged_allowlist = merge_list(entry.second, key, allowlist, doc_path);
                } else if (key == kBlocklistKey) {
                    merged_blocklist = merge_list(entry.second, key, blocklist, doc_path);
                } else if (key == kChildBindingKey) {
                    child_filter = entry.second;
                } else {
                    unexpected.push_back(key);
                }
            }
            if (!unexpected.empty()) {
                std::string keys;
                for (const auto& key : unexpected) {
                    keys += (keys.empty() ? "" : ", ") + key;
                }
                throw SchemaError(kDiagUnknownKey, "'include:' in " + doc_path +
                                                       " should not have these unexpected contents: " + keys);
            }
            check_include_filters(name, merged_allowlist, merged_blocklist, child_filter, doc_path);
        } else {
            throw SchemaError(kDiagTypeMismatch,
                              "all elements in 'include:' in " + doc_path +
                                  " should be either strings or maps with a 'name' key and optional "
                                  "'property-allowlist' or 'property-blocklist' keys, but got: " +
                                  yaml_inline(element));
        }

        const auto document = resolver_.find(*name);
        if (!document) {
            throw SchemaError(kDiagIncludeNotFound, "'" + *name + "' included from " + doc_path + " not found");
        }

        YAML::Node included = parse_document(document->text, document->path);
        normalize_child_binding(included);
        filter_properties(included, merged_allowlist, merged_blocklist, child_filter);
        expand(included, document->path, merged_allowlist, merged_blocklist, origins);
        return included;
    }

    static NameList merge_list(const YAML::Node& additional_yaml,
                               const std::string& key,
                               const NameList& previous,
                               const std::string& doc_path) {
        if (additional_yaml && !additional_yaml.IsSequence()) {
            throw SchemaError(kDiagIncludeFilter, "'" + key + "' value in " + doc_path + " should be a list");
        }
        NameList additional = read_name_list(additional_yaml, key, doc_path);
        if (!additional) {
            return previous;
        }
        if (previous) {
            additional->insert(additional->end(), previous->begin(), previous->end());
        }
        return additional;
    }

    /// Structure check of one include element, done before the included
    /// document is looked up.
    static void check_include_filters(const std::optional<std::string>& name,
                                      const NameList& allowlist,
                                      const NameList& blocklist,
                                      const YAML::Node& child_filter,
                                      const std::string& doc_path) {
        if (!name) {
            throw SchemaError(kDiagMissingKey, "'include:' element in " + doc_path + " should have a 'name' key");
        }
        if (allowlist && blocklist) {
            throw SchemaError(kDiagIncludeFilter, "'include:' of file '" + *name + "' in " + doc_path +
                                                      " should not specify both 'property-allowlist:' and "
                                                      "'property-blocklist:'");
        }

        check_child_filter(*name, child_filter, doc_path);
    }

    static void check_child_filter(const std::string& name, const YAML::Node& filter, const std::string& doc_path) {
        if (!filter || filter.IsNull()) {
            return;
        }
        if (!filter.IsMap()) {
            throw SchemaError(kDiagIncludeFilter, "'include:' of file '" + name + "' in " + doc_path +
                                                      " has a malformed 'child-binding' filter: " + yaml_inline(filter));
        }
        std::vector<std::string> unexpected;
        for (const auto& key : map_keys(filter)) {
            if (key != kAllowlistKey && key != kBlocklistKey && key != kChildBindingKey) {
                unexpected.push_back(key);
            }
        }
        if (!unexpected.empty()) {
            throw SchemaError(kDiagUnknownKey, "'include:' of file '" + name + "' in " + doc_path +
                                                   " should not have these unexpected contents in a "
                                                   "'child-binding': " + unexpected.front());
        }
        if (get(filter, kAllowlistKey) && get(filter, kBlocklistKey)) {
            throw SchemaError(kDiagIncludeFilter, "'include:' of file '" + name + "' in " + doc_path +
                                                      " should not specify both 'property-allowlist:' and "
                                                      "'property-blocklist:' in a 'child-binding:'");
        }
        check_child_filter(name, get(filter, kChildBindingKey), doc_path);
    }

    /// Apply allow/block filters to container["properties"], then the child
    /// filter to every child node property.
    void filter_properties(YAML::Node container,
                           const NameList& allowlist,
                           const NameList& blocklist,
                           const YAML::Node& child_filter) const {
        const YAML::Node props = get(container, "properties");
        if (!props || !props.IsMap() || props.size() == 0) {
            return;
        }

        std::vector<std::string> existing = map_keys(props);
        std::vector<std::pair<std::string, YAML::Node>> kept;
        std::vector<std::pair<std::string, YAML::Node>> added;
        const auto already_present = [&](const std::string& key) {
            return contains(existing, key) ||
                   std::any_of(added.begin(), added.end(), [&](const auto& entry) { return entry.first == key; });
        };

        for (const auto& entry : props) {
            const std::string name = entry.first.as<std::string>();
            const YAML::Node& spec = entry.second;
            if (is_child_node_spec(spec) || (!allowlist && !blocklist)) {
                kept.emplace_back(name, spec);
                continue;
            }
            if (allowlist) {
                if (contains(*allowlist, name)) {
                    kept.emplace_back(name, spec);
                    continue;
                }
                // A pattern is replaced by exact entries for the allowed
                // names it covers
                for (const auto& allow_key : *allowlist) {
                    if (pattern_matches(name, allow_key) && !already_present(allow_key)) {
                        added.emplace_back(allow_key, YAML::Clone(spec));
                    }
                }
                continue;
            }
            if (contains(*blocklist, name)) {
                continue;
            }
            std::string restricted = name;
            for (const auto& block_key : *blocklist) {
                if (pattern_matches(name, block_key)) {
                    restricted = "(?!^" + block_key + "$)" + restricted;
                }
            }
            if (restricted == name) {
                kept.emplace_back(name, spec);
            } else if (!already_present(restricted)) {
                added.emplace_back(restricted, spec);
            }
        }

        YAML::Node filtered(YAML::NodeType::Map);
        for (const auto& [name, spec] : kept) {
            filtered[name] = spec;
        }
        for (const auto& [name, spec] : added) {
            filtered[name] = spec;
        }
        container["properties"] = filtered;

        if (!child_filter || !child_filter.IsMap()) {
            return;
        }
        const NameList child_allowlist = read_name_list(get(child_filter, kAllowlistKey), kAllowlistKey, binding_path_);
        const NameList child_blocklist = read_name_list(get(child_filter, kBlocklistKey), kBlocklistKey, binding_path_);
        for (const auto& entry : filtered) {
            if (is_child_node_spec(entry.second)) {
                filter_properties(entry.second, child_allowlist, child_blocklist, get(child_filter, kChildBindingKey));
            }
        }
    }

    /// Recursively merge 'from' into 'to'; values in 'to' take precedence.
    void merge_yaml(YAML::Node to, const YAML::Node& from, bool check_required, const std::string& parent_key) const {
        for (const auto& entry : from) {
            const std::string key = entry.first.as<std::string>();
            const YAML::Node& from_value = entry.second;
            YAML::Node to_value = get(to, key);

            if (to_value && to_value.IsMap() && from_value.IsMap()) {
                merge_yaml(to_value, from_value, check_required, key);
            } else if (!to_value) {
                to[key] = YAML::Clone(from_value);
            } else if (bad_overwrite(key, to_value, from_value, check_required)) {
                throw SchemaError(kDiagMergeConflict, binding_path_ + " (in '" + parent_key + "'): '" + key +
                                                          "' from included file overwritten ('" +
                                                          yaml_inline(from_value) + "' replaced with '" +
                                                          yaml_inline(to_value) + "')");
            } else if (key == "required") {
                const auto from_required = detail::scalar_bool(from_value);
                const auto to_required = detail::scalar_bool(to_value);
                if (!from_required || !to_required) {
                    throw SchemaError(kDiagTypeMismatch, "malformed 'required:' setting for '" + parent_key +
                                                             "' in 'properties' in " + binding_path_ +
                                                             ", expected true/false");
                }
                to[key] = *to_required || *from_required;
            }
        }
    }

    bool bad_overwrite(const std::string& key,
                       const YAML::Node& to_value,
                       const YAML::Node& from_value,
                       bool check_required) const {
        if (detail::yaml_equal(to_value, from_value)) {
            return false;
        }
        if (contains(options_.overridable_keys, key)) {
            return false;
        }
        if (key == "required") {
            if (!check_required) {
                return false;
            }
            return detail::scalar_bool(from_value).value_or(false) && !detail::scalar_bool(to_value).value_or(true);
        }
        return true;
    }

    std::string binding_path_;
    const IncludeResolver& resolver_;
    const BindingOptions& options_;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw SchemaError(kDiagIncludeNotFound, "cannot read binding " + path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

}  // namespace

// =============================================================================
// Include resolvers
// =============================================================================

void InMemoryBindings::add(std::string name, std::string text) {
    documents_[std::move(name)] = std::move(text);
}

std::optional<BindingDocument> InMemoryBindings::find(std::string_view name) const {
    lookups_.emplace_back(name);
    const auto it = documents_.find(name);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return BindingDocument{it->first, it->second};
}

BindingDirectory::BindingDirectory(std::vector<std::filesystem::path> roots) {
    for (const auto& root : roots) {
        std::vector<std::filesystem::path> found;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
            const auto ext = entry.path().extension();
            if (entry.is_regular_file() && (ext == ".yaml" || ext == ".yml")) {
                found.push_back(entry.path());
            }
        }
        std::sort(found.begin(), found.end());
        for (auto& path : found) {
            by_name_.emplace(path.filename().string(), path);
            files_.push_back(std::move(path));
        }
    }
}

std::optional<BindingDocument> BindingDirectory::find(std::string_view name) const {
    const auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return BindingDocument{it->second.string(), read_file(it->second)};
}

// =============================================================================
// Binding
// =============================================================================

bool Binding::ChildBindings::matches(std::string_view node_name) const {
    if (node_name == pattern) {
        return true;
    }
    return regex_ && std::regex_match(node_name.begin(), node_name.end(), *regex_);
}

Binding::Binding(Passkey, SourceKind kind, std::string path, bool is_child)
    : kind_(kind), path_(std::move(path)), is_child_(is_child) {}

std::shared_ptr<const Binding> Binding::load(const std::filesystem::path& path,
                                             SourceKind kind,
                                             const IncludeResolver& resolver,
                                             const BindingOptions& options) {
    return load_string(read_file(path), path.string(), kind, resolver, options);
}

std::shared_ptr<const Binding> Binding::load_string(const std::string& text,
                                                    std::string path,
                                                    SourceKind kind,
                                                    const IncludeResolver& resolver,
                                                    const BindingOptions& options) {
    YAML::Node doc = parse_document(text, path);
    auto binding = std::make_shared<Binding>(Passkey{}, kind, std::move(path), false);
    binding->build(doc, resolver, options, std::nullopt, std::nullopt);
    return binding;
}

std::shared_ptr<const Binding> Binding::from_yaml(const YAML::Node& source,
                                                  std::string path,
                                                  SourceKind kind,
                                                  const IncludeResolver& resolver,
                                                  const BindingOptions& options,
                                                  const NameList& allowlist,
                                                  const NameList& blocklist,
                                                  bool is_child) {
    if (!source.IsMap()) {
        throw SchemaError(kDiagTypeMismatch, path + ": invalid contents, expected a mapping");
    }
    auto binding = std::make_shared<Binding>(Passkey{}, kind, std::move(path), is_child);
    binding->build(YAML::Clone(source), resolver, options, allowlist, blocklist);
    return binding;
}

void Binding::build(YAML::Node source,
                    const IncludeResolver& resolver,
                    const BindingOptions& options,
                    const NameList& allowlist,
                    const NameList& blocklist) {
    IncludeExpander expander(path_, resolver, options);
    IncludeExpander::SpecOrigins origins;
    expander.normalize_child_binding(source);
    expander.expand(source, path_, allowlist, blocklist, origins);
    yaml_ = source;

    check_top_level(options);

    BindingOptions child_options = options;
    child_options.require_schema = false;
    child_options.require_description = false;

    const YAML::Node props = get(yaml_, "properties");
    if (!props) {
        return;
    }
    if (!props.IsMap()) {
        throw SchemaError(kDiagTypeMismatch, "'properties:' in " + path_ + " should be a map");
    }
    for (const auto& entry : props) {
        const std::string name = entry.first.as<std::string>();
        if (is_child_node_spec(entry.second)) {
            ChildBindings child;
            child.pattern = name;
            if (looks_like_pattern(name)) {
                try {
                    child.regex_.emplace(name, std::regex::ECMAScript);
                } catch (const std::regex_error& e) {
                    throw SchemaError(kDiagTypeMismatch,
                                      "child binding pattern '" + name + "' in " + path_ + " is invalid: " + e.what());
                }
            }
            child.bindings.push_back(
                from_yaml(entry.second, path_, kind_, resolver, child_options, allowlist, blocklist, true));
            child_bindings_.push_back(std::move(child));
            continue;
        }
        const auto origin = origins.find(name);
        specs_.push_back(PropertySpec::parse(name, entry.second, origin != origins.end() ? origin->second : path_,
                                             kind_));
    }
}

void Binding::check_top_level(const BindingOptions& options) {
    const bool hardware = kind_ == SourceKind::Hardware;
    schema_key_ = (hardware && !get(yaml_, "schema")) ? "compatible" : "schema";

    if (const YAML::Node schema = get(yaml_, schema_key_)) {
        auto value = detail::scalar_string(schema);
        if (!value) {
            throw SchemaError(kDiagTypeMismatch, "malformed '" + schema_key_ + ": " + yaml_inline(schema) +
                                                     "' field in " + path_ + " - should be a string, not " +
                                                     detail::yaml_node_class(schema));
        }
        schema_ = std::move(value);
    } else if (options.require_schema) {
        throw SchemaError(kDiagMissingKey, "missing '" + schema_key_ + "' property in " + path_);
    }

    if (const YAML::Node description = get(yaml_, "description")) {
        if (!description.IsScalar() || description.Scalar().empty()) {
            throw SchemaError(kDiagTypeMismatch, "malformed or empty 'description' in " + path_);
        }
        description_ = description.Scalar();
    } else if (options.require_description) {
        throw SchemaError(kDiagMissingKey, "missing 'description' in " + path_);
    }

    std::map<std::string, std::string> legacy = {
        {"sub-node", "use a property with 'type: node' instead"},
        {"title", "use 'description' instead"},
    };
    std::set<std::string> top_level = {schema_key_, "description", "properties"};
    if (is_child_) {
        top_level.insert("type");
    }
    if (hardware) {
        legacy.emplace("#cells", "expected *-cells syntax");
        legacy.emplace("child", "use 'bus: <bus>' instead");
        legacy.emplace("child-bus", "use 'bus: <bus>' instead");
        legacy.emplace("parent", "use 'on-bus: <bus>' instead");
        legacy.emplace("parent-bus", "use 'on-bus: <bus>' instead");
        top_level.insert({"bus", "on-bus"});
    }

    for (const auto& entry : yaml_) {
        const std::string key = entry.first.as<std::string>();
        if (const auto it = legacy.find(key); it != legacy.end()) {
            throw SchemaError(kDiagLegacyKey, "legacy '" + key + ":' in " + path_ + ", " + it->second);
        }
        const bool cells_key = hardware && key.size() > 6 && key.compare(key.size() - 6, 6, "-cells") == 0;
        if (cells_key) {
            std::vector<std::string> names;
            bool ok = entry.second.IsSequence();
            if (ok) {
                for (const auto& item : entry.second) {
                    auto name = detail::scalar_string(item);
                    if (!name) {
                        ok = false;
                        break;
                    }
                    names.push_back(std::move(*name));
                }
            }
            if (!ok) {
                throw SchemaError(kDiagTypeMismatch, "malformed '" + key + ":' in " + path_ +
                                                         ", expected a list of strings");
            }
            specifier2cells_[key.substr(0, key.size() - 6)] = std::move(names);
        } else if (top_level.count(key) == 0) {
            std::string expected;
            for (const auto& name : top_level) {
                expected += (expected.empty() ? "" : ", ") + name;
            }
            throw SchemaError(kDiagUnknownKey, "unknown key '" + key + "' in " + path_ + ", expected one of " +
                                                   expected + (hardware ? ", or *-cells" : ""));
        }
    }

    if (const YAML::Node bus = get(yaml_, "bus")) {
        if (bus.IsScalar()) {
            buses_.push_back(bus.Scalar());
        } else if (bus.IsSequence() &&
                   std::all_of(bus.begin(), bus.end(), [](const YAML::Node& item) { return item.IsScalar(); })) {
            for (const auto& item : bus) {
                buses_.push_back(item.Scalar());
            }
        } else {
            throw SchemaError(kDiagTypeMismatch,
                              "malformed 'bus:' value in " + path_ + ", expected string or list of strings");
        }
    }
    if (const YAML::Node on_bus = get(yaml_, "on-bus")) {
        if (!on_bus.IsScalar()) {
            throw SchemaError(kDiagTypeMismatch, "malformed 'on-bus:' value in " + path_ + ", expected string");
        }
        on_bus_ = on_bus.Scalar();
    }
}

const PropertySpec* Binding::find_spec(std::string_view prop_name) const {
    for (const auto& spec : specs_) {
        if (spec.name() == prop_name) {
            return &spec;
        }
    }
    for (const auto& spec : specs_) {
        if (spec.is_pattern() && spec.matches(prop_name)) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<const Binding>> Binding::child_bindings_for(std::string_view node_name) const {
    std::vector<std::shared_ptr<const Binding>> out;
    for (const auto& entry : child_bindings_) {
        if (entry.matches(node_name)) {
            out.insert(out.end(), entry.bindings.begin(), entry.bindings.end());
        }
    }
    return out;
}

std::string Binding::dump() const {
    return YAML::Dump(yaml_);
}

}  // namespace settree::v1

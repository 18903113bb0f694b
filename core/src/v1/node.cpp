#include "settree/v1/node.hpp"
#include "settree/v1/errors.hpp"
#include "settree/v1/util.hpp"

#include <algorithm>

namespace settree::v1 {

void throw_property_type_mismatch(const Property& property, std::string_view requested) {
    throw PropertyError(kDiagTypeMismatch, "property '" + property.name() + "' on " + property.node_path() +
                                               " has type '" + property.type() + "', requested " +
                                               std::string(requested));
}

std::optional<std::size_t> Property::enum_index() const {
    const auto& values = spec_->enum_values();
    if (!values) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < values->size(); ++i) {
        if (enum_matches((*values)[i], value_)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::size_t>> Property::enum_indices() const {
    const auto& values = spec_->enum_values();
    if (!values) {
        return std::nullopt;
    }
    std::vector<std::size_t> indices;
    for (const auto& part : scalar_parts(value_)) {
        const auto it = std::find_if(values->begin(), values->end(),
                                     [&](const EnumValue& entry) { return enum_matches(entry, part); });
        if (it == values->end()) {
            throw PropertyError(kDiagEnumViolation, "value " + describe(part) + " of property '" + name_ + "' on " +
                                                        node_path_ + " is not in its 'enum' list");
        }
        indices.push_back(static_cast<std::size_t>(it - values->begin()));
    }
    return indices;
}

std::vector<std::string> Property::val_as_tokens() const {
    if (const auto* text = std::get_if<std::string>(&value_)) {
        return {str_as_token(*text)};
    }
    if (const auto* texts = std::get_if<std::vector<std::string>>(&value_)) {
        std::vector<std::string> tokens;
        tokens.reserve(texts->size());
        for (const auto& text : *texts) {
            tokens.push_back(str_as_token(text));
        }
        return tokens;
    }
    throw_property_type_mismatch(*this, "string tokens");
}

std::optional<std::string> Property::description() const {
    if (const auto& text = spec_->description()) {
        return str_strip(*text);
    }
    return std::nullopt;
}

Node::Node(SourceKind kind, const RawNode& raw, std::string source_path)
    : kind_(kind), raw_(&raw), source_path_(std::move(source_path)) {
    key_.parent_path = raw.parent.value_or("");
    key_.name = raw.name;
}

std::vector<std::string> Node::binding_paths() const {
    std::vector<std::string> paths;
    paths.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
        paths.push_back(binding->path());
    }
    return paths;
}

const Property* Node::find_property(std::string_view prop_name) const {
    for (const auto& prop : properties_) {
        if (prop.name() == prop_name) {
            return &prop;
        }
    }
    return nullptr;
}

std::optional<std::string> Node::description() const {
    if (bindings_.empty() || !bindings_.front()->description()) {
        return std::nullopt;
    }
    return str_strip(*bindings_.front()->description());
}

bool Node::has_child_binding() const {
    return std::any_of(bindings_.begin(), bindings_.end(),
                       [](const BindingPtr& binding) { return !binding->child_bindings().empty(); });
}

std::size_t Node::child_index(std::string_view child_path) const {
    const auto& kids = children();
    const auto it = std::find(kids.begin(), kids.end(), child_path);
    if (it == kids.end()) {
        throw PropertyError(kDiagBadReference, "'" + std::string(child_path) + "' is not a child of " + path());
    }
    return static_cast<std::size_t>(it - kids.begin());
}

std::string Node::z_path_id() const {
    return path_id(path());
}

bool Node::is_pci_device() const {
    return std::find(on_buses_.begin(), on_buses_.end(), "pcie") != on_buses_.end();
}

void Node::add_binding(BindingPtr binding, std::optional<std::string> schema) {
    if (schema) {
        matching_schemas_.push_back(std::move(*schema));
    }
    bindings_.push_back(std::move(binding));
}

void Node::set_bus_info(std::vector<std::string> buses,
                        std::optional<std::string> bus_node,
                        std::vector<std::string> on_buses) {
    buses_ = std::move(buses);
    bus_node_ = std::move(bus_node);
    on_buses_ = std::move(on_buses);
}

}  // namespace settree::v1

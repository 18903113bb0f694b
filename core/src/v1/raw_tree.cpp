#include "settree/v1/raw_tree.hpp"
#include "settree/v1/errors.hpp"

#include <algorithm>
#include <sstream>

namespace settree::v1 {

RawValue RawValue::from_bool(bool value) {
    RawValue raw;
    raw.kind = RawKind::Boolean;
    raw.boolean = value;
    return raw;
}

RawValue RawValue::from_int(std::int64_t value) {
    RawValue raw;
    raw.kind = RawKind::Integer;
    raw.integer = value;
    return raw;
}

RawValue RawValue::from_float(double value) {
    RawValue raw;
    raw.kind = RawKind::Float;
    raw.real = value;
    return raw;
}

RawValue RawValue::from_string(std::string value) {
    RawValue raw;
    raw.kind = RawKind::String;
    raw.text = std::move(value);
    return raw;
}

RawValue RawValue::from_bytes(Bytes value) {
    RawValue raw;
    raw.kind = RawKind::Bytes;
    raw.bytes = std::move(value);
    return raw;
}

RawValue RawValue::reference(std::string target) {
    RawValue raw;
    raw.kind = RawKind::Reference;
    raw.text = std::move(target);
    return raw;
}

RawValue RawValue::list(std::vector<RawValue> values) {
    RawValue raw;
    raw.kind = RawKind::List;
    raw.items = std::move(values);
    return raw;
}

RawValue RawValue::cells(std::initializer_list<std::int64_t> values) {
    std::vector<RawValue> items;
    items.reserve(values.size());
    for (const auto value : values) {
        items.push_back(from_int(value));
    }
    return list(std::move(items));
}

RawValue RawValue::strings(std::initializer_list<std::string> values) {
    std::vector<RawValue> items;
    items.reserve(values.size());
    for (const auto& value : values) {
        items.push_back(from_string(value));
    }
    return list(std::move(items));
}

bool RawValue::is_list_of(RawKind k) const noexcept {
    return kind == RawKind::List &&
           std::all_of(items.begin(), items.end(), [k](const RawValue& item) { return item.kind == k; });
}

std::string RawValue::describe() const {
    std::ostringstream out;
    switch (kind) {
        case RawKind::Empty: out << "<empty>"; break;
        case RawKind::Boolean: out << (boolean ? "true" : "false"); break;
        case RawKind::Integer: out << integer; break;
        case RawKind::Float: out << real; break;
        case RawKind::String: out << '"' << text << '"'; break;
        case RawKind::Reference: out << '&' << text; break;
        case RawKind::Bytes: {
            out << '[';
            static constexpr char kHex[] = "0123456789abcdef";
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (i > 0) out << ' ';
                out << kHex[bytes[i] >> 4] << kHex[bytes[i] & 0x0f];
            }
            out << ']';
            break;
        }
        case RawKind::List: {
            out << '<';
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out << ' ';
                out << items[i].describe();
            }
            out << '>';
            break;
        }
    }
    return out.str();
}

const RawValue* RawNode::find(std::string_view prop_name) const {
    for (const auto& prop : properties) {
        if (prop.name == prop_name) {
            return &prop.value;
        }
    }
    return nullptr;
}

RawNode& RawNode::set(std::string prop_name, RawValue value) {
    for (auto& prop : properties) {
        if (prop.name == prop_name) {
            prop.value = std::move(value);
            return *this;
        }
    }
    properties.push_back(RawProperty{std::move(prop_name), std::move(value)});
    return *this;
}

RawNode& RawNode::label(std::string value) {
    labels.push_back(std::move(value));
    return *this;
}

RawTree::RawTree(SourceKind kind, std::string source_path)
    : kind_(kind),
      source_path_(std::move(source_path)),
      schema_property_(default_schema_property(kind)),
      enabled_property_(default_enabled_property(kind)) {}

RawNode& RawTree::add_node(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        throw StateError(kDiagBadState, "raw node path '" + path + "' is not absolute");
    }
    if (find(path) != nullptr) {
        throw StateError(kDiagBadState, "raw node '" + path + "' added twice");
    }
    RawNode node;
    node.path = path;
    node.name = name_of(path);
    if (path != "/") {
        const std::string parent = parent_path_of(path);
        RawNode* parent_node = find(parent);
        if (parent_node == nullptr) {
            if (parent != "/") {
                throw StateError(kDiagBadState, "parent of raw node '" + path + "' does not exist");
            }
            parent_node = &add_node("/");
        }
        parent_node->children.push_back(path);
        node.parent = parent;
    }
    nodes_.push_back(std::move(node));
    return nodes_.back();
}

RawNode* RawTree::find(std::string_view path) {
    for (auto& node : nodes_) {
        if (node.path == path) {
            return &node;
        }
    }
    return nullptr;
}

const RawNode* RawTree::find(std::string_view path) const {
    for (const auto& node : nodes_) {
        if (node.path == path) {
            return &node;
        }
    }
    return nullptr;
}

std::string parent_path_of(std::string_view path) {
    const auto pos = path.rfind('/');
    if (pos == std::string_view::npos || pos == 0) {
        return "/";
    }
    return std::string(path.substr(0, pos));
}

std::string name_of(std::string_view path) {
    if (path == "/") {
        return "/";
    }
    const auto pos = path.rfind('/');
    return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

std::size_t path_depth(std::string_view path) noexcept {
    if (path == "/") {
        return 0;
    }
    return static_cast<std::size_t>(std::count(path.begin(), path.end(), '/'));
}

}  // namespace settree::v1

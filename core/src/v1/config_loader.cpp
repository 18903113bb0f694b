#include "settree/v1/parser/config_loader.hpp"
#include "settree/v1/errors.hpp"

#include "yaml_scalar.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <vector>

namespace settree::v1::parser {

namespace {

using detail::ScalarClass;

void merge_into(YAML::Node target, const YAML::Node& overlay) {
    for (const auto& entry : overlay) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node& const_target = target;
        const YAML::Node existing = const_target[key];
        if (existing && existing.IsMap() && entry.second.IsMap()) {
            merge_into(target[key], entry.second);
        } else {
            target[key] = YAML::Clone(entry.second);
        }
    }
}

void find_named(const YAML::Node& map, const std::string& name, std::vector<YAML::Node>& found) {
    for (const auto& entry : map) {
        if (!entry.second.IsMap()) {
            continue;
        }
        if (entry.first.as<std::string>() == name) {
            found.push_back(entry.second);
        }
        find_named(entry.second, name, found);
    }
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(path.substr(1));
    while (std::getline(in, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

RawValue to_raw(const YAML::Node& value, const std::string& where) {
    if (value.IsSequence()) {
        std::vector<RawValue> items;
        items.reserve(value.size());
        for (const auto& item : value) {
            items.push_back(to_raw(item, where));
        }
        return RawValue::list(std::move(items));
    }
    if (!value.IsDefined() || value.IsNull()) {
        return RawValue::empty();
    }
    if (!value.IsScalar()) {
        throw PropertyError(kDiagTypeMismatch, "unsupported value " + detail::yaml_inline(value) + " in " + where);
    }
    switch (detail::classify_scalar(value)) {
        case ScalarClass::Null: return RawValue::empty();
        case ScalarClass::Boolean: return RawValue::from_bool(*detail::scalar_bool(value));
        case ScalarClass::Integer: return RawValue::from_int(*detail::scalar_int(value));
        case ScalarClass::Float: return RawValue::from_float(*detail::scalar_float(value));
        case ScalarClass::String: return RawValue::from_string(value.Scalar());
    }
    return RawValue::from_string(value.Scalar());
}

void add_nodes(RawTree& tree, const std::string& path, const YAML::Node& map) {
    RawNode& node = tree.add_node(path);
    std::vector<std::pair<std::string, YAML::Node>> children;
    for (const auto& entry : map) {
        const std::string key = entry.first.as<std::string>();
        if (key.empty() || key.find('/') != std::string::npos) {
            throw PropertyError(kDiagBadValue, "invalid node or property name '" + key + "' in " + path + " in " +
                                                   tree.source_path());
        }
        if (entry.second.IsMap()) {
            children.emplace_back(key, entry.second);
        } else {
            node.set(key, to_raw(entry.second, path + " in " + tree.source_path()));
        }
    }
    for (const auto& [name, child] : children) {
        add_nodes(tree, (path == "/" ? "" : path) + "/" + name, child);
    }
}

}  // namespace

ConfigLoader::ConfigLoader(ConfigLoaderOptions options) : options_(options) {}

RawTree ConfigLoader::load(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file) {
        throw PropertyError(kDiagBadValue, "cannot open configuration file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str(), path.string());
}

RawTree ConfigLoader::load_string(const std::string& content, const std::string& source_path) const {
    YAML::Node overlays;
    try {
        overlays = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw PropertyError(kDiagYamlSyntax, "YAML parse error in " + source_path + ": " + e.what());
    }
    if (!overlays.IsSequence()) {
        throw PropertyError(kDiagTypeMismatch, "expected a list of configuration overlays in " + source_path);
    }

    YAML::Node merged(YAML::NodeType::Map);
    for (const auto& overlay : overlays) {
        if (!overlay.IsMap()) {
            throw PropertyError(kDiagTypeMismatch, "overlay " + detail::yaml_inline(overlay) + " in " + source_path +
                                                       " should be a map of mount points to configuration nodes");
        }
        for (const auto& entry : overlay) {
            if (!entry.first.IsScalar()) {
                throw PropertyError(kDiagTypeMismatch, "mount point " + detail::yaml_inline(entry.first) + " in " +
                                                           source_path + " should be a string");
            }
            const std::string mount = entry.first.Scalar();
            if (options_.skip_extensions && mount.rfind("x-", 0) == 0) {
                continue;
            }
            if (!entry.second.IsMap()) {
                throw PropertyError(kDiagTypeMismatch, "overlay for mount point '" + mount + "' in " + source_path +
                                                           " should be a map");
            }

            if (!mount.empty() && mount.front() == '/') {
                YAML::Node target = merged;
                for (const auto& part : split_path(mount)) {
                    const YAML::Node& const_target = target;
                    const YAML::Node existing = const_target[part];
                    if (!existing || !existing.IsMap()) {
                        target[part] = YAML::Node(YAML::NodeType::Map);
                    }
                    YAML::Node next = target[part];
                    target.reset(next);
                }
                merge_into(target, entry.second);
                continue;
            }

            if (mount.find('/') != std::string::npos) {
                throw PropertyError(kDiagBadValue, "mount point '" + mount + "' in " + source_path +
                                                       " should be either an absolute path or a label without '/'");
            }
            std::vector<YAML::Node> found;
            find_named(merged, mount, found);
            if (found.empty()) {
                throw PropertyError(kDiagBadReference, "target label '" + mount + "' for overlay in " + source_path +
                                                           " not found in configuration");
            }
            if (found.size() > 1) {
                throw PropertyError(kDiagBadReference, "the label '" + mount + "' is not unique in " + source_path);
            }
            merge_into(found.front(), entry.second);
        }
    }

    RawTree tree(SourceKind::Config, source_path);
    add_nodes(tree, "/", merged);
    return tree;
}

}  // namespace settree::v1::parser

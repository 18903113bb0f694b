#include "settree/v1/config_tree.hpp"
#include "settree/v1/errors.hpp"
#include "settree/v1/parser/config_loader.hpp"

namespace settree::v1 {

ConfigTree::ConfigTree(RawTree raw, const std::vector<BindingPtr>& bindings, ConfigTreeOptions options)
    : PartialTree(std::move(raw), bindings), options_(std::move(options)) {
    setup();
}

ConfigTree::ConfigTree(RawTree raw, const BindingDirectory& directory, ConfigTreeOptions options)
    : PartialTree(std::move(raw), directory, options.binding), options_(std::move(options)) {
    setup();
}

std::unique_ptr<ConfigTree> ConfigTree::from_file(const std::filesystem::path& path,
                                                  const BindingDirectory& directory,
                                                  ConfigTreeOptions options) {
    return std::make_unique<ConfigTree>(parser::ConfigLoader().load(path), directory, std::move(options));
}

void ConfigTree::setup() {
    if (kind() != SourceKind::Config) {
        throw StateError(kDiagBadState, "a configuration tree needs a config source, got " +
                                         std::string(to_string(kind())) + " (" + source_path() + ")");
    }
    if (options_.err_on_deprecated) {
        diagnostics().escalate(WarningKind::DeprecatedProperty);
    }
    if (options_.err_on_enum_tokenizable) {
        diagnostics().escalate(WarningKind::EnumTokenizable);
    }
}

bool ConfigTree::compute_enabled(const Node& node) const {
    const RawValue* enabled = node.raw().find(raw().enabled_property());
    if (enabled == nullptr) {
        return true;
    }
    if (!enabled->is(RawKind::Boolean)) {
        throw PropertyError(kDiagTypeMismatch, "'" + raw().enabled_property() + "' in " + node.path() + " in " +
                                                   source_path() + " should be a boolean, not " +
                                                   enabled->describe());
    }
    return enabled->boolean;
}

std::vector<std::string> ConfigTree::label_candidates(const Node& node) const {
    std::vector<std::string> labels = node.labels();
    if (node.parent_path()) {
        labels.insert(labels.begin(), node.name());
    }
    return labels;
}

std::optional<std::string> ConfigTree::by_label(std::string_view label) const {
    const auto paths = paths_for_label(label);
    if (paths.size() == 1) {
        return paths.front();
    }
    if (paths.empty() && merged() != nullptr) {
        return merged()->path_for_label(label);
    }
    return std::nullopt;
}

std::string ConfigTree::resolve_reference(const Node& node, std::string_view prop_name, const RawValue& value) const {
    if (!value.is(RawKind::String) && !value.is(RawKind::Reference)) {
        throw PropertyError(kDiagBadReference, "expected property '" + std::string(prop_name) + "' on " +
                                                   node.path() + " to be '&foo' or '/bar/foo', not " +
                                                   value.describe());
    }
    const std::string& pointer = value.text;
    std::optional<std::string> path;
    if (!pointer.empty() && pointer.front() == '&') {
        path = by_label(std::string_view(pointer).substr(1));
    } else if (node_in_progress(pointer) != nullptr) {
        path = pointer;
    } else if (auto labelled = by_label(pointer)) {
        path = std::move(labelled);
    } else if (merged() != nullptr && merged()->has_path(pointer)) {
        path = pointer;
    }
    if (!path) {
        throw PropertyError(kDiagBadReference, "could not resolve property '" + std::string(prop_name) + "' on " +
                                                   node.path() + " in " + source_path() + " to a node ('" + pointer +
                                                   "')");
    }
    return *path;
}

}  // namespace settree::v1

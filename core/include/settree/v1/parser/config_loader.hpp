#pragma once

#include "settree/v1/raw_tree.hpp"

#include <filesystem>
#include <string>

namespace settree::v1::parser {

struct ConfigLoaderOptions {
    bool skip_extensions = true;  // Ignore 'x-' mount points (reusable snippets)
};

/// Reads configuration sources: a YAML list of overlays, each mapping a mount
/// point (an absolute path, or the unique name of an existing node) to a map
/// of properties and child nodes. Overlays are merged in order; later values
/// replace earlier ones, nested maps merge recursively.
class ConfigLoader {
public:
    explicit ConfigLoader(ConfigLoaderOptions options = {});

    // Parse from file
    [[nodiscard]] RawTree load(const std::filesystem::path& path) const;

    // Parse from string; 'source_path' names the source in messages
    [[nodiscard]] RawTree load_string(const std::string& content, const std::string& source_path = "<string>") const;

private:
    ConfigLoaderOptions options_;
};

}  // namespace settree::v1::parser

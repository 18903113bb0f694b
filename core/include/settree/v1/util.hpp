#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace settree::v1 {

/// Replace every non-word character with '_' ("foo-bar.1" -> "foo_bar_1")
[[nodiscard]] std::string str_as_token(std::string_view value);

/// Lowercased C identifier for a name: '-', ',', '.', '@', '/' and '+'
/// become '_'
[[nodiscard]] std::string str_to_ident(std::string_view value);

/// Path identifier of a node path: "N" for "/", one "_S_<ident>" per path
/// component otherwise ("/soc/uart@1000" -> "N_S_soc_S_uart_1000")
[[nodiscard]] std::string path_id(std::string_view path);

/// 'value' without leading and trailing whitespace (including newlines)
[[nodiscard]] std::string str_strip(std::string_view value);

/// Vendor prefix table: prefix -> vendor name
using VendorPrefixes = std::map<std::string, std::string, std::less<>>;

/// Load a vendor prefix file. Each non-empty line that does not start with
/// '#' has the form "prefix<TAB>vendor name". Throws SchemaError on
/// malformed lines or an unreadable file.
[[nodiscard]] VendorPrefixes load_vendor_prefixes(const std::filesystem::path& path);

/// Same as load_vendor_prefixes() on in-memory text; 'origin' names the
/// source in messages.
[[nodiscard]] VendorPrefixes parse_vendor_prefixes(std::string_view text, std::string_view origin = "<string>");

}  // namespace settree::v1

#include "settree/v1/values.hpp"

#include <sstream>
#include <type_traits>

namespace settree::v1 {

std::optional<std::int64_t> ControllerAndData::cell(std::string_view cell_name) const {
    for (const auto& [key, value] : data) {
        if (key == cell_name) {
            return value;
        }
    }
    return std::nullopt;
}

namespace {

template <typename T, typename Fn>
void join(std::ostringstream& out, const std::vector<T>& items, Fn&& render) {
    out << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << ", ";
        render(items[i]);
    }
    out << ']';
}

}  // namespace

std::string describe(const PropertyValue& value) {
    std::ostringstream out;
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out << "<none>";
            } else if constexpr (std::is_same_v<T, bool>) {
                out << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                out << v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                out << '"' << v << '"';
            } else if constexpr (std::is_same_v<T, NodeRef>) {
                out << v.path;
            } else if constexpr (std::is_same_v<T, Bytes>) {
                join(out, v, [&](std::uint8_t b) { out << static_cast<unsigned>(b); });
            } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                join(out, v, [&](const std::string& s) { out << '"' << s << '"'; });
            } else if constexpr (std::is_same_v<T, std::vector<NodeRef>>) {
                join(out, v, [&](const NodeRef& r) { out << r.path; });
            } else if constexpr (std::is_same_v<T, IndexedRefList>) {
                join(out, v, [&](const std::optional<ControllerAndData>& entry) {
                    if (!entry) {
                        out << "<null>";
                        return;
                    }
                    out << "{controller: " << entry->controller << ", data: {";
                    for (std::size_t i = 0; i < entry->data.size(); ++i) {
                        if (i > 0) out << ", ";
                        out << entry->data[i].first << ": " << entry->data[i].second;
                    }
                    out << "}}";
                });
            } else {
                join(out, v, [&](const auto& item) { out << item; });
            }
        },
        value);
    return out.str();
}

std::vector<PropertyValue> scalar_parts(const PropertyValue& value) {
    std::vector<PropertyValue> parts;
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> ||
                          std::is_same_v<T, std::string> || std::is_same_v<T, double>) {
                parts.emplace_back(v);
            } else if constexpr (std::is_same_v<T, std::vector<std::int64_t>> ||
                                 std::is_same_v<T, std::vector<std::string>> ||
                                 std::is_same_v<T, std::vector<double>>) {
                for (const auto& item : v) {
                    parts.emplace_back(item);
                }
            } else if constexpr (std::is_same_v<T, Bytes>) {
                for (const auto byte : v) {
                    parts.emplace_back(static_cast<std::int64_t>(byte));
                }
            }
        },
        value);
    return parts;
}

}  // namespace settree::v1

#include "yaml_scalar.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>

namespace settree::v1::detail {

namespace {

const std::regex& int_pattern() {
    static const std::regex re(R"(^[-+]?(0|[1-9][0-9]*|0x[0-9a-fA-F]+|0o[0-7]+)$)");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re(
        R"(^([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))$)");
    return re;
}

bool is_plain(const YAML::Node& node) {
    // Quoted scalars carry the non-specific "!" tag
    return node.Tag() != "!";
}

std::optional<std::int64_t> parse_int_text(const std::string& text) {
    std::string body = text;
    bool negative = false;
    if (!body.empty() && (body.front() == '-' || body.front() == '+')) {
        negative = body.front() == '-';
        body.erase(0, 1);
    }
    int base = 10;
    if (body.rfind("0x", 0) == 0) {
        base = 16;
        body.erase(0, 2);
    } else if (body.rfind("0o", 0) == 0) {
        base = 8;
        body.erase(0, 2);
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long magnitude = std::strtoull(body.c_str(), &end, base);
    if (errno == ERANGE || end == body.c_str() || *end != '\0') {
        return std::nullopt;
    }
    constexpr auto kMax = static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > kMax + 1ULL) {
            return std::nullopt;
        }
        return magnitude == kMax + 1ULL ? std::numeric_limits<std::int64_t>::min()
                                        : -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > kMax) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(magnitude);
}

}  // namespace

ScalarClass classify_scalar(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return ScalarClass::Null;
    }
    if (!node.IsScalar()) {
        return ScalarClass::String;
    }
    if (!is_plain(node)) {
        return ScalarClass::String;
    }
    const std::string& text = node.Scalar();
    if (text == "true" || text == "True" || text == "TRUE" || text == "false" || text == "False" ||
        text == "FALSE") {
        return ScalarClass::Boolean;
    }
    if (std::regex_match(text, int_pattern())) {
        return ScalarClass::Integer;
    }
    if (std::regex_match(text, float_pattern())) {
        return ScalarClass::Float;
    }
    return ScalarClass::String;
}

std::optional<bool> scalar_bool(const YAML::Node& node) {
    if (classify_scalar(node) != ScalarClass::Boolean) {
        return std::nullopt;
    }
    const char first = node.Scalar().front();
    return first == 't' || first == 'T';
}

std::optional<std::int64_t> scalar_int(const YAML::Node& node) {
    if (classify_scalar(node) != ScalarClass::Integer) {
        return std::nullopt;
    }
    return parse_int_text(node.Scalar());
}

std::optional<double> scalar_float(const YAML::Node& node) {
    const ScalarClass cls = classify_scalar(node);
    if (cls == ScalarClass::Integer) {
        const auto value = parse_int_text(node.Scalar());
        if (!value) {
            return std::nullopt;
        }
        return static_cast<double>(*value);
    }
    if (cls != ScalarClass::Float) {
        return std::nullopt;
    }
    std::string text = node.Scalar();
    if (text.find("inf") != std::string::npos || text.find("Inf") != std::string::npos ||
        text.find("INF") != std::string::npos) {
        const double inf = std::numeric_limits<double>::infinity();
        return text.front() == '-' ? -inf : inf;
    }
    if (text.find("nan") != std::string::npos || text.find("NaN") != std::string::npos ||
        text.find("NAN") != std::string::npos) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::strtod(text.c_str(), nullptr);
}

std::optional<std::string> scalar_string(const YAML::Node& node) {
    if (classify_scalar(node) != ScalarClass::String || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.Scalar();
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        switch (classify_scalar(node)) {
            case ScalarClass::Boolean: return "boolean";
            case ScalarClass::Integer: return "integer";
            case ScalarClass::Float: return "float";
            default: return "string";
        }
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

bool yaml_equal(const YAML::Node& a, const YAML::Node& b) {
    if (a.Type() != b.Type()) {
        return false;
    }
    switch (a.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return true;
        case YAML::NodeType::Scalar:
            return a.Scalar() == b.Scalar() && classify_scalar(a) == classify_scalar(b);
        case YAML::NodeType::Sequence: {
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!yaml_equal(a[i], b[i])) {
                    return false;
                }
            }
            return true;
        }
        case YAML::NodeType::Map: {
            if (a.size() != b.size()) {
                return false;
            }
            for (const auto& entry : a) {
                const YAML::Node other = b[entry.first.Scalar()];
                if (!other || !yaml_equal(entry.second, other)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

std::string yaml_inline(const YAML::Node& node) {
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

}  // namespace settree::v1::detail

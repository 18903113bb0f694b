#include "settree/v1/util.hpp"
#include "settree/v1/errors.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace settree::v1 {

std::string str_as_token(std::string_view value) {
    std::string out(value);
    for (auto& c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return out;
}

std::string str_to_ident(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '-':
            case ',':
            case '.':
            case '@':
            case '/':
            case '+':
                out.push_back('_');
                break;
            default:
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

std::string path_id(std::string_view path) {
    std::string id = "N";
    std::size_t pos = 0;
    while (pos < path.size()) {
        const auto start = pos + 1;
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            id += "_S_" + str_to_ident(path.substr(start, end - start));
        }
        pos = end;
    }
    return id;
}

std::string str_strip(std::string_view value) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto first = value.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(kSpace);
    return std::string(value.substr(first, last - first + 1));
}

VendorPrefixes parse_vendor_prefixes(std::string_view text, std::string_view origin) {
    VendorPrefixes prefixes;
    std::istringstream in{std::string(text)};
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#' ||
            line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        const auto tab = line.find('\t');
        if (tab == std::string::npos || tab == 0) {
            throw SchemaError(kDiagBadValue, std::string(origin) + ":" + std::to_string(line_no) +
                                                 ": expected 'prefix<TAB>vendor name', got '" + line + "'");
        }
        prefixes[line.substr(0, tab)] = line.substr(tab + 1);
    }
    return prefixes;
}

VendorPrefixes load_vendor_prefixes(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw SchemaError(kDiagIncludeNotFound, "cannot read vendor prefix file " + path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return parse_vendor_prefixes(text.str(), path.string());
}

}  // namespace settree::v1

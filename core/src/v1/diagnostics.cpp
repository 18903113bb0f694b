#include "settree/v1/diagnostics.hpp"

#include <algorithm>

namespace settree::v1 {

bool Diagnostics::escalated(WarningKind kind) const noexcept {
    return std::find(escalated_.begin(), escalated_.end(), kind) != escalated_.end();
}

void Diagnostics::warn(WarningKind kind, std::string_view code, const std::string& message) {
    if (!escalated(kind)) {
        warnings_.push_back(with_diag_code(code, message));
        return;
    }
    if (kind == WarningKind::VendorPrefix) {
        throw SchemaError(std::string(code), message);
    }
    throw PropertyError(std::string(code), message);
}

bool Diagnostics::has_warning(std::string_view code) const {
    const std::string needle = "[" + std::string(code) + "]";
    return std::any_of(warnings_.begin(), warnings_.end(), [&](const std::string& warning) {
        return warning.rfind(needle, 0) == 0;
    });
}

}  // namespace settree::v1

#pragma once

#include <cstdint>
#include <string_view>

namespace settree::v1 {

/// True if 'text' only uses the characters of an integer expression
/// ("()|&!+-/*x" and digits).
[[nodiscard]] bool is_int_expression(std::string_view text);

/// Evaluate an integer expression. Supports binary '|', '&', '+', '-', '*',
/// '/' (integer division), unary '-', '+', '!', parentheses and decimal or
/// 0x literals. Precedence follows C: '*' '/' bind tighter than '+' '-',
/// which bind tighter than '&', then '|'.
/// Throws PropertyError on malformed input or division by zero.
[[nodiscard]] std::int64_t eval_int_expression(std::string_view text);

}  // namespace settree::v1

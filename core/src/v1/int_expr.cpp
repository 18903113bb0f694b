#include "settree/v1/int_expr.hpp"
#include "settree/v1/errors.hpp"

#include <limits>
#include <regex>
#include <string>

namespace settree::v1 {

namespace {

class ExprParser {
public:
    explicit ExprParser(std::string_view text) : text_(text) {}

    std::int64_t parse() {
        const std::int64_t value = parse_or();
        if (pos_ != text_.size()) {
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw PropertyError(kDiagBadExpression, "invalid integer expression '" + std::string(text_) + "': " + what);
    }

    bool accept(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::int64_t parse_or() {
        std::int64_t value = parse_and();
        while (accept('|')) {
            value |= parse_and();
        }
        return value;
    }

    std::int64_t parse_and() {
        std::int64_t value = parse_additive();
        while (accept('&')) {
            value &= parse_additive();
        }
        return value;
    }

    std::int64_t parse_additive() {
        std::int64_t value = parse_multiplicative();
        for (;;) {
            if (accept('+')) {
                value = wrap(static_cast<std::uint64_t>(value) + static_cast<std::uint64_t>(parse_multiplicative()));
            } else if (accept('-')) {
                value = wrap(static_cast<std::uint64_t>(value) - static_cast<std::uint64_t>(parse_multiplicative()));
            } else {
                return value;
            }
        }
    }

    std::int64_t parse_multiplicative() {
        std::int64_t value = parse_unary();
        for (;;) {
            if (accept('*')) {
                value = wrap(static_cast<std::uint64_t>(value) * static_cast<std::uint64_t>(parse_unary()));
            } else if (accept('/')) {
                const std::int64_t divisor = parse_unary();
                if (divisor == 0) {
                    fail("division by zero");
                }
                if (divisor == -1 && value == std::numeric_limits<std::int64_t>::min()) {
                    fail("overflow");
                }
                value /= divisor;
            } else {
                return value;
            }
        }
    }

    std::int64_t parse_unary() {
        if (accept('-')) {
            return wrap(0 - static_cast<std::uint64_t>(parse_unary()));
        }
        if (accept('+')) {
            return parse_unary();
        }
        if (accept('!')) {
            return parse_unary() == 0 ? 1 : 0;
        }
        return parse_primary();
    }

    std::int64_t parse_primary() {
        if (accept('(')) {
            const std::int64_t value = parse_or();
            if (!accept(')')) {
                fail("missing ')'");
            }
            return value;
        }
        return parse_number();
    }

    std::int64_t parse_number() {
        const std::size_t start = pos_;
        int base = 10;
        if (text_.substr(pos_, 2) == "0x") {
            base = 16;
            pos_ += 2;
        }
        std::uint64_t value = 0;
        std::size_t digits = 0;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            int digit = -1;
            if (c >= '0' && c <= '9') {
                digit = c - '0';
            } else if (base == 16 && c >= 'a' && c <= 'f') {
                digit = c - 'a' + 10;
            } else if (base == 16 && c >= 'A' && c <= 'F') {
                digit = c - 'A' + 10;
            }
            if (digit < 0) {
                break;
            }
            value = value * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(digit);
            ++pos_;
            ++digits;
        }
        if (digits == 0) {
            pos_ = start;
            fail(pos_ < text_.size() ? "expected a number at '" + std::string(text_.substr(pos_)) + "'"
                                     : "unexpected end of expression");
        }
        return wrap(value);
    }

    static std::int64_t wrap(std::uint64_t value) { return static_cast<std::int64_t>(value); }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

bool is_int_expression(std::string_view text) {
    static const std::regex pattern(R"(^[()|&!+\-/*x0-9]+$)");
    return std::regex_match(text.begin(), text.end(), pattern);
}

std::int64_t eval_int_expression(std::string_view text) {
    if (!is_int_expression(text)) {
        throw PropertyError(kDiagBadExpression, "'" + std::string(text) + "' is not an integer expression");
    }
    return ExprParser(text).parse();
}

}  // namespace settree::v1

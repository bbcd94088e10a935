#include "./scalar.hpp"

#include <ctre.hpp>
#include <neo/utility.hpp>

#include <charconv>
#include <cstdint>
#include <limits>

using namespace scribe;

namespace {

constexpr ctll::fixed_string DEC_INT_RE = "[-+]?[0-9]+";
constexpr ctll::fixed_string OCT_INT_RE = "0o([0-7]+)";
constexpr ctll::fixed_string HEX_INT_RE = "0x([0-9a-fA-F]+)";
constexpr ctll::fixed_string FLOAT_RE   = "[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?";
constexpr ctll::fixed_string INF_RE     = "([-+]?)\\.(inf|Inf|INF)";
constexpr ctll::fixed_string NAN_RE     = "\\.(nan|NaN|NAN)";

/// Parse the digits of an unsigned integer in the given base. Overflow produces a float.
value parse_digits(std::string_view digits, int base) noexcept {
    std::int64_t n   = 0;
    auto         end = digits.data() + digits.size();
    auto         res = std::from_chars(digits.data(), end, n, base);
    if (res.ec == std::errc{} && res.ptr == end) {
        return n;
    }
    // Too large for int64. Accumulate into a double instead
    double d = 0;
    for (char c : digits) {
        int digit = (c >= '0' && c <= '9') ? (c - '0') : ((c | 0x20) - 'a' + 10);
        d         = d * base + digit;
    }
    return d;
}

}  // namespace

std::optional<value> scribe::parse_core_integer(std::string_view spelling) noexcept {
    if (auto oct = ctre::match<OCT_INT_RE>(spelling)) {
        return parse_digits(oct.get<1>().to_view(), 8);
    }
    if (auto hex = ctre::match<HEX_INT_RE>(spelling)) {
        return parse_digits(hex.get<1>().to_view(), 16);
    }
    if (!ctre::match<DEC_INT_RE>(spelling)) {
        return std::nullopt;
    }
    auto digits = spelling;
    if (digits.front() == '+') {
        digits.remove_prefix(1);
    }
    std::int64_t n   = 0;
    auto         end = digits.data() + digits.size();
    auto         res = std::from_chars(digits.data(), end, n);
    if (res.ec == std::errc{} && res.ptr == end) {
        return value(n);
    }
    // Out of range: keep the magnitude as a float
    double d = 0;
    std::from_chars(digits.data(), end, d);
    return value(d);
}

std::optional<double> scribe::parse_core_float(std::string_view spelling) noexcept {
    if (auto inf = ctre::match<INF_RE>(spelling)) {
        auto sign = inf.get<1>().to_view();
        return sign == "-" ? -std::numeric_limits<double>::infinity()
                           : std::numeric_limits<double>::infinity();
    }
    if (ctre::match<NAN_RE>(spelling)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (!ctre::match<FLOAT_RE>(spelling)) {
        return std::nullopt;
    }
    auto digits = spelling;
    if (digits.front() == '+') {
        digits.remove_prefix(1);
    }
    double d   = 0;
    auto   end = digits.data() + digits.size();
    auto   res = std::from_chars(digits.data(), end, d);
    if (res.ptr != end) {
        return std::nullopt;
    }
    if (res.ec == std::errc::result_out_of_range) {
        // from_chars does not give a value on overflow. Saturate the way strtod would.
        bool neg = spelling.front() == '-';
        auto exp = spelling.find_first_of("eE");
        if (exp != spelling.npos && spelling.substr(exp + 1).starts_with('-')) {
            return neg ? -0.0 : 0.0;
        }
        return neg ? -std::numeric_limits<double>::infinity()
                   : std::numeric_limits<double>::infinity();
    }
    return d;
}

value scribe::resolve_plain_scalar(std::string_view spelling) {
    if (spelling == neo::oper::any_of("", "~", "null", "Null", "NULL")) {
        return nullptr;
    }
    if (spelling == neo::oper::any_of("true", "True", "TRUE")) {
        return true;
    }
    if (spelling == neo::oper::any_of("false", "False", "FALSE")) {
        return false;
    }
    if (auto i = parse_core_integer(spelling)) {
        return *i;
    }
    if (auto d = parse_core_float(spelling)) {
        return *d;
    }
    return spelling;
}

bool scribe::is_yaml11_bool_spelling(std::string_view s) noexcept {
    return s
        == neo::oper::any_of("y",
                             "Y",
                             "yes",
                             "Yes",
                             "YES",
                             "n",
                             "N",
                             "no",
                             "No",
                             "NO",
                             "on",
                             "On",
                             "ON",
                             "off",
                             "Off",
                             "OFF");
}

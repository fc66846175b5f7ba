#include "cobra/value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

static std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static bool isDigit(char ch) { return ch >= '0' && ch <= '9'; }

static std::string formatNumber(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";
    if (v == 0.0) return "0";

    char buf[40];
    if (v == std::trunc(v) && std::fabs(v) < 1e21) {
        std::snprintf(buf, sizeof(buf), "%.0f", v);
        return buf;
    }
    // Shortest representation that reads back to the same double.
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return buf;
}

} // namespace

namespace cobra {

std::string_view typeName(FlagType type) {
    switch (type) {
        case FlagType::String: return "string";
        case FlagType::Boolean: return "boolean";
        case FlagType::Number: return "number";
    }
    return "string";
}

Scalar zeroValue(FlagType type) {
    switch (type) {
        case FlagType::String: return std::string();
        case FlagType::Boolean: return false;
        case FlagType::Number: return 0.0;
    }
    return std::string();
}

std::string toString(const Scalar& value) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return formatNumber(x);
            } else {
                return x;
            }
        },
        value);
}

std::string toString(const FlagValue& value) {
    if (const auto* list = std::get_if<ScalarList>(&value)) {
        std::string out;
        for (std::size_t i = 0; i < list->size(); ++i) {
            if (i) out.push_back(',');
            out += toString((*list)[i]);
        }
        return out;
    }
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, ScalarList>) {
                return {};
            } else {
                return toString(Scalar(x));
            }
        },
        value);
}

bool isNumber(std::string_view s) {
    const std::size_t n = s.size();
    if (n > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        for (std::size_t i = 2; i < n; ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
        }
        return true;
    }

    std::size_t i = 0;
    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;

    std::size_t intDigits = 0;
    while (i < n && isDigit(s[i])) {
        ++i;
        ++intDigits;
    }
    if (intDigits > 0) {
        if (i < n && s[i] == '.') {
            ++i;
            while (i < n && isDigit(s[i])) ++i;
        }
    } else {
        if (i >= n || s[i] != '.') return false;
        ++i;
        std::size_t fracDigits = 0;
        while (i < n && isDigit(s[i])) {
            ++i;
            ++fracDigits;
        }
        if (fracDigits == 0) return false;
    }

    if (i < n && s[i] == 'e') {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t expDigits = 0;
        while (i < n && isDigit(s[i])) {
            ++i;
            ++expDigits;
        }
        if (expDigits == 0) return false;
    }
    return i == n;
}

bool tryParseNumber(std::string_view s, double& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

bool tryParseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

std::optional<Scalar> firstScalar(const FlagValue& value) {
    return std::visit(
        [](const auto& x) -> std::optional<Scalar> {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, ScalarList>) {
                if (x.empty()) return std::nullopt;
                return x.front();
            } else {
                return Scalar(x);
            }
        },
        value);
}

ScalarList toList(const FlagValue& value) {
    return std::visit(
        [](const auto& x) -> ScalarList {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, ScalarList>) {
                return x;
            } else {
                return {Scalar(x)};
            }
        },
        value);
}

} // namespace cobra

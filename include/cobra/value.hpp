#ifndef COBRA_VALUE_HPP
#define COBRA_VALUE_HPP

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace cobra {

enum class FlagType {
    String,
    Boolean,
    Number,
};

// One parsed or declared flag value.
using Scalar = std::variant<bool, double, std::string>;
using ScalarList = std::vector<Scalar>;
// A flag given several times holds a list of its occurrences.
using FlagValue = std::variant<bool, double, std::string, ScalarList>;

[[nodiscard]] std::string_view typeName(FlagType type);

// Zero value of a type: "", false or 0.
[[nodiscard]] Scalar zeroValue(FlagType type);

// Command-line rendering of a value: "12", "0.5", "true", "a,b".
[[nodiscard]] std::string toString(const Scalar& value);
[[nodiscard]] std::string toString(const FlagValue& value);

// minimist's notion of a numeric token: decimal with optional fraction/exponent, or 0x-hex.
[[nodiscard]] bool isNumber(std::string_view s);

bool tryParseNumber(std::string_view s, double& out);
bool tryParseBool(std::string_view s, bool& out);

// First scalar of a value; an empty list yields nothing.
[[nodiscard]] std::optional<Scalar> firstScalar(const FlagValue& value);
[[nodiscard]] ScalarList toList(const FlagValue& value);

template <typename T>
inline constexpr bool kDependentFalse = false;

// Read-time coercion of a stored scalar to the type a handler asks for. Fails for NaN or a number outside
// the range of an arithmetic T.
template <typename T>
bool scalarTo(const Scalar& value, T& out) {
    if constexpr (std::is_same_v<T, Scalar>) {
        out = value;
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        out = toString(value);
        return true;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto* b = std::get_if<bool>(&value)) {
            out = *b;
            return true;
        }
        if (const auto* d = std::get_if<double>(&value)) {
            out = (*d != 0.0);
            return true;
        }
        const auto& s = std::get<std::string>(value);
        if (s.empty()) {
            out = false;
            return true;
        }
        return tryParseBool(s, out);
    } else if constexpr (std::is_arithmetic_v<T>) {
        double d = 0.0;
        if (const auto* b = std::get_if<bool>(&value)) {
            d = *b ? 1.0 : 0.0;
        } else if (const auto* n = std::get_if<double>(&value)) {
            d = *n;
        } else {
            const auto& s = std::get<std::string>(value);
            if (!s.empty() && !tryParseNumber(s, d)) return false;
        }
        if constexpr (std::is_integral_v<T>) {
            if (std::isnan(d)) return false;
            if (!(d > static_cast<double>(std::numeric_limits<T>::lowest()) - 1.0)) return false;
            if (!(d < static_cast<double>(std::numeric_limits<T>::max()) + 1.0)) return false;
        } else if (std::isfinite(d)) {
            if (d < std::numeric_limits<T>::lowest() || d > std::numeric_limits<T>::max()) return false;
        }
        out = static_cast<T>(d);
        return true;
    } else {
        static_assert(kDependentFalse<T>, "flag values convert to bool, std::string, Scalar or arithmetic types");
        return false;
    }
}

} // namespace cobra

#endif // COBRA_VALUE_HPP

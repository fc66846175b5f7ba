#ifndef COBRA_FLAG_SET_HPP
#define COBRA_FLAG_SET_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "flag.hpp"
#include "value.hpp"

namespace cobra {

// Binding of one flag for one dispatch.
struct FlagState {
    std::optional<FlagValue> value;
    // Set when the parsed value differs from the configured default (always, when there is none).
    bool changed{false};
};

// Flags handed to a command handler: the effective flag set of the resolved command together with the
// values bound by a single dispatch. Lookups accept a flag's long name or its short alias.
class FlagSet {
public:
    struct Entry {
        const Flag* flag{nullptr};
        FlagState state;
    };

    FlagSet() = default;
    explicit FlagSet(std::vector<Entry> entries);

    // Parsed value, else the declared default, else the type's zero value. A repeated flag yields its first
    // occurrence.
    template <typename T>
    T value(const std::string& key) const {
        const auto& e = lookup(key);
        std::optional<Scalar> v;
        if (e.state.value) {
            v = firstScalar(*e.state.value);
        } else if (e.flag->defaultValue()) {
            v = firstScalar(*e.flag->defaultValue());
        }
        if (!v) v = zeroValue(e.flag->type());
        return convert<T>(key, *v);
    }

    // Every parsed occurrence; the default is not consulted.
    template <typename T>
    std::vector<T> values(const std::string& key) const {
        const auto& e = lookup(key);
        std::vector<T> out;
        if (!e.state.value) return out;
        for (const auto& v : toList(*e.state.value)) out.push_back(convert<T>(key, v));
        return out;
    }

    // nullptr for an unknown key.
    [[nodiscard]] const Flag* getFlag(const std::string& key) const;

    [[nodiscard]] const FlagState& state(const std::string& key) const { return lookup(key).state; }
    [[nodiscard]] bool changed(const std::string& key) const { return lookup(key).state.changed; }
    [[nodiscard]] bool contains(const std::string& key) const { return index_.find(key) != index_.end(); }

    // Binding of a specific declaration; nullptr if it is not part of this set.
    [[nodiscard]] const FlagState* stateOf(const Flag& flag) const;

    // Throws RequiredFlagMissing for the first required flag whose value still equals its default. An unset
    // value equals an unset default.
    void checkRequired() const;

    // Declarations in binding order.
    [[nodiscard]] std::vector<const Flag*> flags() const;
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }

private:
    const Entry& lookup(const std::string& key) const;

    template <typename T>
    static T convert(const std::string& key, const Scalar& v) {
        T out{};
        if (!scalarTo(v, out)) {
            throw InvalidFlagValue(key, toString(v), std::is_same_v<T, bool> ? "boolean" : "number");
        }
        return out;
    }

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace cobra

#endif // COBRA_FLAG_SET_HPP

#ifndef COBRA_FLAG_HPP
#define COBRA_FLAG_HPP

#include <optional>
#include <string>
#include <utility>

#include "value.hpp"

namespace cobra {

// Declaration of a flag as passed to Command::addFlag.
//
//   cmd.addFlag(FlagSpec::number("port", "p").withUsage("port to listen on").withDefault(8080));
//
// A spec without a type is a number flag. At least one of name/shortName must be set.
struct FlagSpec {
    FlagType type{FlagType::Number};
    std::string name;
    std::string shortName;
    std::string usage;
    bool required{false};
    bool persistent{false};
    std::optional<FlagValue> defaultValue;

    static FlagSpec string(std::string name, std::string shortName = {}, std::string usage = {}) {
        return make(FlagType::String, std::move(name), std::move(shortName), std::move(usage));
    }
    static FlagSpec boolean(std::string name, std::string shortName = {}, std::string usage = {}) {
        return make(FlagType::Boolean, std::move(name), std::move(shortName), std::move(usage));
    }
    static FlagSpec number(std::string name, std::string shortName = {}, std::string usage = {}) {
        return make(FlagType::Number, std::move(name), std::move(shortName), std::move(usage));
    }

    FlagSpec& withShort(std::string s) {
        shortName = std::move(s);
        return *this;
    }
    FlagSpec& withUsage(std::string u) {
        usage = std::move(u);
        return *this;
    }
    FlagSpec& withDefault(bool v) {
        defaultValue = FlagValue(v);
        return *this;
    }
    FlagSpec& withDefault(int v) {
        defaultValue = FlagValue(static_cast<double>(v));
        return *this;
    }
    FlagSpec& withDefault(double v) {
        defaultValue = FlagValue(v);
        return *this;
    }
    FlagSpec& withDefault(const char* v) {
        defaultValue = FlagValue(std::string(v));
        return *this;
    }
    FlagSpec& withDefault(std::string v) {
        defaultValue = FlagValue(std::move(v));
        return *this;
    }
    FlagSpec& withDefault(ScalarList v) {
        defaultValue = FlagValue(std::move(v));
        return *this;
    }
    FlagSpec& markRequired(bool v = true) {
        required = v;
        return *this;
    }
    // Persistent flags are visible to every descendant command.
    FlagSpec& markPersistent(bool v = true) {
        persistent = v;
        return *this;
    }

private:
    static FlagSpec make(FlagType type, std::string name, std::string shortName, std::string usage) {
        FlagSpec spec;
        spec.type = type;
        spec.name = std::move(name);
        spec.shortName = std::move(shortName);
        spec.usage = std::move(usage);
        return spec;
    }
};

// Immutable flag declaration owned by the command it was added to. Parsed values live in a FlagSet,
// so a Flag's address is its identity across dispatches.
class Flag {
public:
    explicit Flag(FlagSpec spec)
        : type_(spec.type),
          name_(std::move(spec.name)),
          shortName_(std::move(spec.shortName)),
          usage_(std::move(spec.usage)),
          required_(spec.required),
          persistent_(spec.persistent),
          defaultValue_(std::move(spec.defaultValue)) {}

    Flag(const Flag&) = delete;
    Flag& operator=(const Flag&) = delete;

    [[nodiscard]] FlagType type() const { return type_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& shortName() const { return shortName_; }
    [[nodiscard]] const std::string& usage() const { return usage_; }
    [[nodiscard]] bool required() const { return required_; }
    [[nodiscard]] bool persistent() const { return persistent_; }
    [[nodiscard]] const std::optional<FlagValue>& defaultValue() const { return defaultValue_; }

    // Key the token parser reports this flag under: the short alias when there is one.
    [[nodiscard]] const std::string& key() const { return shortName_.empty() ? name_ : shortName_; }

    // "--name", or "-n" for a short-only flag.
    [[nodiscard]] std::string displayName() const;

    // True if this flag and `other` share a non-empty name or a non-empty short alias.
    [[nodiscard]] bool conflictsWith(const Flag& other) const;

private:
    FlagType type_;
    std::string name_;      // port
    std::string shortName_; // p
    std::string usage_;
    bool required_{false};
    bool persistent_{false};
    std::optional<FlagValue> defaultValue_;
};

} // namespace cobra

#endif // COBRA_FLAG_HPP

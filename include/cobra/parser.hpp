#ifndef COBRA_PARSER_HPP
#define COBRA_PARSER_HPP

#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "value.hpp"

namespace cobra {

// minimist-compatible argv tokenizer.
//
// Supported forms: --k=v, --k v, --no-k, -abc (grouped shorts), -k=v, -n5, and a literal `--` after which
// nothing is parsed. Values of keys not typed as string that look numeric become numbers. A key given more
// than once collects a list, except boolean keys which keep the last value. Unknown flags are accepted.
class Parser {
public:
    struct Options {
        // key -> other names; aliases receive every value their key receives (and vice versa).
        std::unordered_map<std::string, std::vector<std::string>> alias;
        // Applied to keys (and their aliases) that no token set.
        std::unordered_map<std::string, FlagValue> defaults;
        // Boolean keys never consume a following token (except a literal true/false) and start out false.
        std::vector<std::string> booleans;
        // String keys keep their values verbatim; a bare occurrence is "".
        std::vector<std::string> strings;
        // Keep tokens after `--` apart in passthrough() instead of appending them to positionals().
        bool passthrough{false};
    };

    explicit Parser(const std::vector<std::string>& args) : Parser(args, Options{}) {}

    Parser(const std::vector<std::string>& args, Options options);

    [[nodiscard]] const std::vector<std::string>& positionals() const { return positionals_; }
    [[nodiscard]] const std::vector<std::string>& passthrough() const { return passthrough_; }

    [[nodiscard]] bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

    // nullptr when the key was neither given nor defaulted.
    [[nodiscard]] const FlagValue* get(const std::string& key) const;

    [[nodiscard]] const std::map<std::string, FlagValue>& values() const { return values_; }

private:
    void setArg(const std::string& key, FlagValue value);
    void setArg(const std::string& key, const std::string& value) { setArg(key, FlagValue(value)); }
    void setKey(const std::string& key, const FlagValue& value);
    void parseLong(const std::vector<std::string>& args, std::size_t& i);
    void parseShort(const std::vector<std::string>& args, std::size_t& i);
    void applyDefaults();

    [[nodiscard]] bool isBool(const std::string& key) const { return bools_.count(key) != 0; }
    [[nodiscard]] bool isString(const std::string& key) const { return strings_.count(key) != 0; }
    [[nodiscard]] bool aliasIsBoolean(const std::string& key) const;
    // A bare occurrence: "" for string keys, true otherwise.
    [[nodiscard]] FlagValue bareValue(const std::string& key) const;

    static bool looksLikeFlag(const std::string& s);
    static bool isBoolLiteral(const std::string& s) { return s == "true" || s == "false"; }

    std::unordered_map<std::string, std::vector<std::string>> aliases_;
    std::unordered_set<std::string> bools_;
    std::unordered_set<std::string> strings_;
    std::unordered_map<std::string, FlagValue> defaults_;
    std::map<std::string, FlagValue> values_;
    std::vector<std::string> positionals_;
    std::vector<std::string> passthrough_;
    bool keepPassthrough_{false};
};

} // namespace cobra

#endif // COBRA_PARSER_HPP

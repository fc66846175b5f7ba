#include "cobra/parser.hpp"

#include <algorithm>
#include <utility>

namespace {

static bool isAsciiLetter(char ch) { return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z'); }

static bool isWordChar(char ch) { return isAsciiLetter(ch) || (ch >= '0' && ch <= '9') || ch == '_'; }

static bool isDigit(char ch) { return ch >= '0' && ch <= '9'; }

// True when the token ends in something numeric ("b1", "5.", "1e5"); -n5 style values are detected this way.
static bool endsWithNumber(const std::string& s) {
    if (s.empty()) return false;
    if (isDigit(s.back())) return true;
    return s.size() >= 2 && s.back() == '.' && isDigit(s[s.size() - 2]);
}

static void appendTo(cobra::ScalarList& list, const cobra::FlagValue& value) {
    const auto items = cobra::toList(value);
    list.insert(list.end(), items.begin(), items.end());
}

} // namespace

namespace cobra {

Parser::Parser(const std::vector<std::string>& args, Options options)
    : defaults_(std::move(options.defaults)),
      keepPassthrough_(options.passthrough) {
    for (const auto& key : options.booleans) {
        if (!key.empty()) bools_.insert(key);
    }

    for (const auto& [key, names] : options.alias) {
        aliases_[key] = names;
        for (const auto& x : names) {
            std::vector<std::string> others{key};
            for (const auto& y : names) {
                if (y != x) others.push_back(y);
            }
            aliases_[x] = std::move(others);
        }
    }

    for (const auto& key : options.strings) {
        if (key.empty()) continue;
        strings_.insert(key);
        const auto it = aliases_.find(key);
        if (it == aliases_.end()) continue;
        for (const auto& k : it->second) strings_.insert(k);
    }

    // Booleans always have a value, false unless defaulted otherwise.
    for (const auto& key : bools_) {
        const auto d = defaults_.find(key);
        setArg(key, d == defaults_.end() ? FlagValue(false) : d->second);
    }

    const auto dashes = std::find(args.begin(), args.end(), std::string("--"));
    const std::vector<std::string> tokens(args.begin(), dashes);
    std::vector<std::string> notFlags;
    if (dashes != args.end()) notFlags.assign(dashes + 1, args.end());

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& arg = tokens[i];
        if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
            parseLong(tokens, i);
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            parseShort(tokens, i);
        } else {
            positionals_.push_back(arg);
        }
    }

    applyDefaults();

    if (keepPassthrough_) {
        passthrough_ = std::move(notFlags);
    } else {
        positionals_.insert(positionals_.end(), notFlags.begin(), notFlags.end());
    }
}

const FlagValue* Parser::get(const std::string& key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return nullptr;
    return &it->second;
}

void Parser::parseLong(const std::vector<std::string>& args, std::size_t& i) {
    const std::string& arg = args[i];

    // --key=value
    const auto eq = arg.find('=', 2);
    if (eq != std::string::npos && eq > 2) {
        const std::string key = arg.substr(2, eq - 2);
        const std::string value = arg.substr(eq + 1);
        if (isBool(key)) {
            setArg(key, FlagValue(value != "false"));
        } else {
            setArg(key, value);
        }
        return;
    }

    // --no-key
    if (arg.size() > 5 && arg.rfind("--no-", 0) == 0) {
        setArg(arg.substr(5), FlagValue(false));
        return;
    }

    // --key [value]
    const std::string key = arg.substr(2);
    const bool hasNext = i + 1 < args.size();
    if (hasNext && !looksLikeFlag(args[i + 1]) && !isBool(key) && !aliasIsBoolean(key)) {
        setArg(key, args[i + 1]);
        ++i;
    } else if (hasNext && isBoolLiteral(args[i + 1])) {
        setArg(key, FlagValue(args[i + 1] == "true"));
        ++i;
    } else {
        setArg(key, bareValue(key));
    }
}

void Parser::parseShort(const std::vector<std::string>& args, std::size_t& i) {
    const std::string& arg = args[i];

    // Every character but the last is a flag of its own; the last may take the next token as its value.
    const std::string letters = arg.substr(1, arg.size() - 2);
    bool broken = false;
    for (std::size_t j = 0; j < letters.size(); ++j) {
        const std::string letter(1, letters[j]);
        const std::string next = arg.substr(j + 2);

        if (next == "-") {
            setArg(letter, next);
            continue;
        }
        if (isAsciiLetter(letters[j]) && next[0] == '=') {
            setArg(letter, next.substr(1));
            broken = true;
            break;
        }
        if (isAsciiLetter(letters[j]) && endsWithNumber(next)) {
            setArg(letter, next);
            broken = true;
            break;
        }
        if (j + 1 < letters.size() && !isWordChar(letters[j + 1])) {
            setArg(letter, next);
            broken = true;
            break;
        }
        setArg(letter, bareValue(letter));
    }

    const std::string key(1, arg.back());
    if (broken || key == "-") return;

    const bool hasNext = i + 1 < args.size() && !args[i + 1].empty();
    if (hasNext && !looksLikeFlag(args[i + 1]) && !isBool(key) && !aliasIsBoolean(key)) {
        setArg(key, args[i + 1]);
        ++i;
    } else if (hasNext && isBoolLiteral(args[i + 1])) {
        setArg(key, FlagValue(args[i + 1] == "true"));
        ++i;
    } else {
        setArg(key, bareValue(key));
    }
}

void Parser::applyDefaults() {
    for (const auto& [key, value] : defaults_) {
        if (has(key)) continue;
        setKey(key, value);
        const auto it = aliases_.find(key);
        if (it == aliases_.end()) continue;
        for (const auto& x : it->second) setKey(x, value);
    }
}

void Parser::setArg(const std::string& key, FlagValue value) {
    if (const auto* s = std::get_if<std::string>(&value); s && !isString(key) && isNumber(*s)) {
        double d = 0.0;
        if (tryParseNumber(*s, d)) value = d;
    }
    setKey(key, value);
    const auto it = aliases_.find(key);
    if (it == aliases_.end()) return;
    for (const auto& x : it->second) setKey(x, value);
}

void Parser::setKey(const std::string& key, const FlagValue& value) {
    const auto it = values_.find(key);
    if (it == values_.end()) {
        values_.emplace(key, value);
        return;
    }
    if (isBool(key) || std::holds_alternative<bool>(it->second)) {
        it->second = value;
        return;
    }
    if (auto* list = std::get_if<ScalarList>(&it->second)) {
        appendTo(*list, value);
        return;
    }
    ScalarList list = toList(it->second);
    appendTo(list, value);
    it->second = std::move(list);
}

bool Parser::aliasIsBoolean(const std::string& key) const {
    const auto it = aliases_.find(key);
    if (it == aliases_.end()) return false;
    return std::any_of(it->second.begin(), it->second.end(), [this](const std::string& x) { return isBool(x); });
}

FlagValue Parser::bareValue(const std::string& key) const {
    if (isString(key)) return FlagValue(std::string());
    return FlagValue(true);
}

bool Parser::looksLikeFlag(const std::string& s) {
    if (s.size() < 2 || s[0] != '-') return false;
    if (s[1] != '-') return true;
    return s.size() >= 3 && s[2] != '-';
}

} // namespace cobra

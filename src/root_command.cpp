#include "cobra/root_command.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

#include "cobra/errors.hpp"
#include "cobra/parser.hpp"

namespace {

// Anything but false, 0, NaN or "" asks for help; "-h=xyz" does too.
bool truthy(const cobra::FlagValue& v) {
    if (const auto* b = std::get_if<bool>(&v)) return *b;
    if (const auto* d = std::get_if<double>(&v)) return !std::isnan(*d) && *d != 0.0;
    if (const auto* s = std::get_if<std::string>(&v)) return !s->empty();
    return true;
}

} // namespace

namespace cobra {

RootCommand::RootCommand(CommandSpec spec) : Command(std::move(spec)) {
    help_ = &addFlag(FlagSpec::boolean("help", "h", "display " + name() + "'s help").markPersistent());
}

std::pair<Command*, std::vector<std::string>> RootCommand::matchCommand(const std::vector<std::string>& args) {
    Parser::Options opts;
    opts.passthrough = true;
    const Parser parsed(args, opts);

    Command* cmd = this;
    const auto& tokens = parsed.positionals();
    std::size_t i = 0;
    for (; i < tokens.size(); ++i) {
        const auto& children = cmd->commands();
        if (children.empty()) break;

        Command* match = nullptr;
        std::size_t count = 0;
        for (const auto& c : children) {
            if (c->name() != tokens[i]) continue;
            match = c.get();
            ++count;
        }
        if (count > 1) throw AmbiguousCommand(tokens[i]);
        if (count == 0) break;
        cmd = match;
    }

    std::vector<std::string> rest(tokens.begin() + static_cast<std::ptrdiff_t>(i), tokens.end());
    rest.insert(rest.end(), parsed.passthrough().begin(), parsed.passthrough().end());
    return {cmd, std::move(rest)};
}

FlagSet RootCommand::bindFlags(const Command& cmd, const std::vector<std::string>& args) const {
    const auto flags = cmd.getFlags();

    Parser::Options opts;
    opts.passthrough = true;
    for (const auto* f : flags) {
        const auto& key = f->key();
        if (!f->shortName().empty() && !f->name().empty()) opts.alias[key] = {f->name()};
        if (f->defaultValue()) opts.defaults[key] = *f->defaultValue();
        switch (f->type()) {
            case FlagType::Boolean: opts.booleans.push_back(key); break;
            case FlagType::String: opts.strings.push_back(key); break;
            case FlagType::Number: break;
        }
    }

    const Parser parsed(args, std::move(opts));

    std::vector<FlagSet::Entry> entries;
    entries.reserve(flags.size());
    for (const auto* f : flags) {
        FlagSet::Entry e;
        e.flag = f;
        if (const auto* v = parsed.get(f->key())) {
            e.state.value = *v;
            e.state.changed = f->defaultValue() ? !(*v == *f->defaultValue()) : true;
        }
        entries.push_back(std::move(e));
    }
    return FlagSet(std::move(entries));
}

int RootCommand::execute(const std::vector<std::string>& args) {
    auto [cmd, rest] = matchCommand(args);

    Dispatch d;
    d.command = cmd;
    d.args = std::move(rest);
    d.flags = bindFlags(*cmd, args);
    last_ = d;

    const auto* helpState = d.flags.stateOf(*help_);
    if (helpState && helpState->value && truthy(*helpState->value)) {
        cmd->help(true);
        last_->helped = true;
        return 1;
    }
    return cmd->invoke(d.args, d.flags);
}

int RootCommand::execute() { return execute(runtime().args()); }

int RootCommand::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return execute(args);
}

void RootCommand::executeAndExit() { runtime().exit(execute()); }

} // namespace cobra

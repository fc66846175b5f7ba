#include "cobra/command.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "cobra/errors.hpp"
#include "cobra/help.hpp"
#include "cobra/utils.hpp"

namespace cobra {

Command::Command(CommandSpec spec)
    : use_(std::move(spec.use)),
      short_(std::move(spec.shortDesc)),
      long_(std::move(spec.longDesc)),
      run_(std::move(spec.run)),
      showHelpOnError_(spec.showHelpOnError) {
    if (use_.empty()) throw MissingUsage();
    name_ = utils::firstWord(use_);
    if (!run_) {
        run_ = [](Command& cmd, const std::vector<std::string>&, const FlagSet&) {
            cmd.help();
            return 1;
        };
    }
}

Command& Command::addCommand(CommandSpec spec) {
    auto child = std::make_unique<Command>(std::move(spec));
    const bool taken = std::any_of(subcommands_.begin(), subcommands_.end(), [&](const std::unique_ptr<Command>& c) {
        return c->name_ == child->name_;
    });
    if (taken) throw DuplicateCommand(child->name_);
    child->parent_ = this;
    subcommands_.push_back(std::move(child));
    return *subcommands_.back();
}

const Flag& Command::addFlag(FlagSpec spec) {
    if (spec.name.empty() && spec.shortName.empty()) {
        throw InvalidFlag("a flag requires a name or a short name");
    }
    auto flag = std::make_unique<Flag>(std::move(spec));
    checkFlags(*flag);
    flags_.push_back(std::move(flag));
    return *flags_.back();
}

void Command::checkFlags(const Flag& candidate) const {
    for (const auto* c = this; c; c = c->parent_) {
        for (const auto& f : c->flags_) {
            if (!candidate.conflictsWith(*f)) continue;
            std::string existing = f->displayName();
            if (!f->name().empty() && !f->shortName().empty()) existing += " -" + f->shortName();
            throw FlagConflict(candidate.displayName(), std::move(existing));
        }
    }
}

const Flag* Command::getFlag(const std::string& name) const {
    for (const auto* c = this; c; c = c->parent_) {
        for (const auto& f : c->flags_) {
            if (f->name() == name) return f.get();
        }
    }
    return nullptr;
}

std::vector<const Flag*> Command::getFlags() const {
    std::vector<const Flag*> out;
    out.reserve(flags_.size());
    for (const auto& f : flags_) out.push_back(f.get());
    for (const auto* c = parent_; c; c = c->parent_) {
        for (const auto& f : c->flags_) {
            if (!f->persistent()) continue;
            if (std::find(out.begin(), out.end(), f.get()) != out.end()) continue;
            out.push_back(f.get());
        }
    }
    return out;
}

Command& Command::root() {
    auto* c = this;
    while (c->parent_) c = c->parent_;
    return *c;
}

const Command& Command::root() const {
    const auto* c = this;
    while (c->parent_) c = c->parent_;
    return *c;
}

Runtime& Command::runtime() const {
    const auto& r = root();
    if (r.runtime_) return *r.runtime_;
    return defaultRuntime();
}

void Command::help(bool longForm) const {
    runtime().write(Stream::Stderr, renderHelp(*this, longForm ? HelpForm::Long : HelpForm::Short));
}

int Command::invoke(const std::vector<std::string>& args, const FlagSet& flags) {
    try {
        const int exitCode = run_(*this, args, flags);
        if (exitCode != 0 && showHelpOnError_) help();
        return exitCode;
    } catch (const SetupError&) {
        throw;
    } catch (const std::exception& e) {
        runtime().write(Stream::Stderr, std::string(e.what()) + "\n");
        if (showHelpOnError_) help();
        return 1;
    }
}

} // namespace cobra

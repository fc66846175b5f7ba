#ifndef COBRA_COMMAND_HPP
#define COBRA_COMMAND_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "flag.hpp"
#include "flag_set.hpp"
#include "runtime.hpp"

namespace cobra {

class Command;

// Mirrors cobra's general shape: Run(cmd, args) plus the bound flags. The return value is the exit code.
using Handler = std::function<int(Command& cmd, const std::vector<std::string>& args, const FlagSet& flags)>;

struct CommandSpec {
    // First word is the command name; the rest is only shown in help. Required.
    std::string use;
    // One line, shown in the parent's command list.
    std::string shortDesc;
    // Shown by --help.
    std::string longDesc;
    // Defaults to printing help and returning 1.
    Handler run;
    // Print help after the handler returns non-zero or throws.
    bool showHelpOnError{false};
};

class Command {
public:
    explicit Command(CommandSpec spec);
    virtual ~Command() = default;

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    // Adds a child and returns it. Throws DuplicateCommand if a sibling already has that name.
    Command& addCommand(CommandSpec spec);

    // Throws FlagConflict when the name or short alias is already used by this command or any ancestor,
    // persistent or not.
    const Flag& addFlag(FlagSpec spec);

    // Own flag with this long name, else the nearest ancestor's.
    [[nodiscard]] const Flag* getFlag(const std::string& name) const;

    // Own flags followed by the persistent flags of every ancestor.
    [[nodiscard]] std::vector<const Flag*> getFlags() const;

    [[nodiscard]] const std::string& use() const { return use_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& shortDesc() const { return short_; }
    [[nodiscard]] const std::string& longDesc() const { return long_; }
    [[nodiscard]] bool showHelpOnError() const { return showHelpOnError_; }

    [[nodiscard]] Command* parent() const { return parent_; }
    [[nodiscard]] bool isRoot() const { return parent_ == nullptr; }
    [[nodiscard]] Command& root();
    [[nodiscard]] const Command& root() const;

    // Children in insertion order.
    [[nodiscard]] const std::vector<std::unique_ptr<Command>>& commands() const { return subcommands_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Flag>>& ownFlags() const { return flags_; }

    // Runtime of the root, or the process default.
    [[nodiscard]] Runtime& runtime() const;

    // Writes help for this command to the error stream.
    void help(bool longForm = false) const;

    // Runs the handler. Exceptions derived from std::exception are reported on the error stream and become
    // exit code 1.
    int invoke(const std::vector<std::string>& args, const FlagSet& flags);

protected:
    void checkFlags(const Flag& candidate) const;

    std::vector<std::unique_ptr<Command>> subcommands_;
    Runtime* runtime_{nullptr};

private:
    std::string use_;
    std::string name_;
    std::string short_;
    std::string long_;
    Handler run_;
    bool showHelpOnError_{false};
    std::vector<std::unique_ptr<Flag>> flags_;
    Command* parent_{nullptr};
};

} // namespace cobra

#endif // COBRA_COMMAND_HPP

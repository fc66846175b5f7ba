#ifndef COBRA_ROOT_COMMAND_HPP
#define COBRA_ROOT_COMMAND_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "command.hpp"

namespace cobra {

// Outcome of the most recent dispatch.
struct Dispatch {
    Command* command{nullptr};
    std::vector<std::string> args;
    FlagSet flags;
    // --help short-circuited the handler.
    bool helped{false};
};

// Top of a command tree. Owns the persistent --help/-h flag and turns raw arguments into a handler call.
class RootCommand : public Command {
public:
    explicit RootCommand(CommandSpec spec);

    // Output and exit for the whole tree. The runtime must outlive the root.
    RootCommand& setRuntime(Runtime& runtime) {
        runtime_ = &runtime;
        return *this;
    }

    // Resolves the command, binds its flags and runs it. Returns the exit code.
    //
    // Throws AmbiguousCommand when a token matches more than one sibling. Setup errors raised by a handler are
    // not caught.
    int execute(const std::vector<std::string>& args);
    // Arguments come from the runtime.
    int execute();
    // argv[0] is skipped.
    int run(int argc, char** argv);
    // Hands the exit code of execute() to Runtime::exit.
    void executeAndExit();

    // Deepest command named by the leading positional tokens, and the tokens left over. Tokens after `--` are
    // never matched; they are appended to the leftovers.
    std::pair<Command*, std::vector<std::string>> matchCommand(const std::vector<std::string>& args);

    // Binds the effective flags of `cmd` against the raw arguments.
    [[nodiscard]] FlagSet bindFlags(const Command& cmd, const std::vector<std::string>& args) const;

    [[nodiscard]] const std::optional<Dispatch>& lastDispatch() const { return last_; }
    [[nodiscard]] const Flag& helpFlag() const { return *help_; }

private:
    const Flag* help_{nullptr};
    std::optional<Dispatch> last_;
};

} // namespace cobra

#endif // COBRA_ROOT_COMMAND_HPP

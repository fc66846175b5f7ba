#include <iostream>
#include <string>
#include <vector>

#include "cobra/cobra.hpp"

namespace {

cobra::Handler greeter(std::string word) {
    return [word](cobra::Command&, const std::vector<std::string>&, const cobra::FlagSet& flags) {
        const std::string name =
            flags.state("name").value ? flags.value<std::string>("name") : std::string("mystery person");
        const std::string strong = flags.value<bool>("strong") ? "!!!" : "";
        std::cout << word << " " << name << strong << "\n";
        return 0;
    };
}

} // namespace

int main(int argc, char** argv) {
    cobra::RootCommand root(cobra::CommandSpec{"greeting"});

    auto& hello = root.addCommand(cobra::CommandSpec{"hello --name string [--strong]", "says hello", "", greeter("hello")});
    hello.addFlag(cobra::FlagSpec::string("name", "n", "name to say hello to"));
    hello.addFlag(cobra::FlagSpec::boolean("strong", "s", "say hello strongly"));

    auto& goodbye =
        root.addCommand(cobra::CommandSpec{"goodbye --name string [--strong]", "says goodbye", "", greeter("goodbye")});
    goodbye.addFlag(cobra::FlagSpec::string("name", "n", "name to say goodbye to"));
    goodbye.addFlag(cobra::FlagSpec::boolean("strong", "s", "say goodbye strongly"));

    return root.run(argc, argv);
}

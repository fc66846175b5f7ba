#include <iostream>
#include <string>
#include <vector>

#include "cobra/cobra.hpp"

int main(int argc, char** argv) {
    cobra::RootCommand root(cobra::CommandSpec{"app", "Required flag example"});

    cobra::CommandSpec doSpec{"do", "Runs the required-flag demo"};
    doSpec.showHelpOnError = true;
    doSpec.run = [](cobra::Command&, const std::vector<std::string>&, const cobra::FlagSet& flags) {
        flags.checkRequired();
        std::cout << flags.value<std::string>("name") << "\n";
        return 0;
    };
    root.addCommand(doSpec).addFlag(cobra::FlagSpec::string("name", "n", "Name to print").markRequired());

    return root.run(argc, argv);
}

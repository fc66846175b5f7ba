#include <iostream>
#include <string>
#include <vector>

#include "cobra/cobra.hpp"

int main(int argc, char** argv) {
    cobra::RootCommand root(cobra::CommandSpec{"app", "A brief description of your application"});
    root.addFlag(cobra::FlagSpec::boolean("verbose", "v", "Enable verbose output").markPersistent());

    cobra::CommandSpec printSpec{"print [words...]", "Prints a message to the console"};
    printSpec.longDesc = "Prints --message, or the given words when there are any.";
    printSpec.run = [](cobra::Command& cmd, const std::vector<std::string>& args, const cobra::FlagSet& flags) {
        if (flags.value<bool>("verbose")) std::cerr << "running " << cmd.name() << "\n";
        if (args.empty()) {
            std::cout << flags.value<std::string>("message") << "\n";
            return 0;
        }
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i) std::cout << " ";
            std::cout << args[i];
        }
        std::cout << "\n";
        return 0;
    };
    root.addCommand(printSpec)
        .addFlag(cobra::FlagSpec::string("message", "m", "Message to print").withDefault("Hello, World!"));

    cobra::CommandSpec repeatSpec{"repeat <text>", "Prints text several times"};
    repeatSpec.showHelpOnError = true;
    repeatSpec.run = [](cobra::Command&, const std::vector<std::string>& args, const cobra::FlagSet& flags) {
        if (args.empty()) return 1;
        const int times = flags.value<int>("times");
        for (int i = 0; i < times; ++i) std::cout << args.front() << "\n";
        return 0;
    };
    root.addCommand(repeatSpec).addFlag(cobra::FlagSpec::number("times", "t", "How many times").withDefault(2));

    return root.run(argc, argv);
}

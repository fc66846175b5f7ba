#ifndef COBRA_HELP_HPP
#define COBRA_HELP_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "flag.hpp"

namespace cobra {

class Command;

enum class HelpForm {
    // Headline is the short description.
    Short,
    // Headline is the long description, falling back to the short one.
    Long,
};

// Longest short alias and longest long name among a set of flags.
struct FlagPad {
    std::size_t shortLen{0};
    std::size_t longLen{0};
};

// Computes the padding for (short, long) name pairs.
FlagPad calcPad(const std::vector<std::pair<std::string, std::string>>& names);

// One row of the flag table without its indent: "-p, --port   Port number".
//
// The short column is shortLen + 3 wide ("-p, "; "-p  " when the flag has no long name) and the long column
// is longLen + 2 wide ("--port"). A column whose pad is zero is omitted.
std::string flagHelp(const Flag& flag, const FlagPad& pad);

// Full help text of a command:
//
//   <headline>
//
//   Usage:
//     <use>                      (leaf)
//     <name> [commands]          (with children)
//
//   Available Commands:
//     <name>   <short>
//
//   Flags:
//     -h, --help   display <root>'s help
std::string renderHelp(const Command& cmd, HelpForm form = HelpForm::Short);

} // namespace cobra

#endif // COBRA_HELP_HPP

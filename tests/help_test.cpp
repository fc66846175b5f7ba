#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cobra/cobra.hpp"
#include "cobra/utils.hpp"

using cobra::Command;
using cobra::CommandSpec;
using cobra::FlagSpec;
using cobra::HelpForm;
using cobra::RootCommand;

TEST(Help, CalcPad) {
    const auto pad = cobra::calcPad({{"p", "port"}, {"", "verbose"}, {"x", ""}});
    EXPECT_EQ(pad.shortLen, 1u);
    EXPECT_EQ(pad.longLen, 7u);

    const auto empty = cobra::calcPad({});
    EXPECT_EQ(empty.shortLen, 0u);
    EXPECT_EQ(empty.longLen, 0u);
}

TEST(Help, FlagRows) {
    const cobra::Flag both(FlagSpec::number("port", "p", "port number"));
    const cobra::Flag longOnly(FlagSpec::string("output", "", "output file"));
    const cobra::Flag shortOnly(FlagSpec::boolean("", "v", "verbose"));
    const cobra::FlagPad pad{1, 6};

    EXPECT_EQ(cobra::flagHelp(both, pad), "-p, --port     port number");
    EXPECT_EQ(cobra::flagHelp(longOnly, pad), "    --output   output file");
    EXPECT_EQ(cobra::flagHelp(shortOnly, pad), "-v  " + std::string(8, ' ') + "   verbose");
}

TEST(Help, ZeroPadDropsColumn) {
    const cobra::Flag f(FlagSpec::boolean("dry-run", "", "print only"));
    EXPECT_EQ(cobra::flagHelp(f, cobra::FlagPad{0, 7}), "--dry-run   print only");
}

TEST(Help, LeafRoot) {
    RootCommand root(CommandSpec{"app [file]", "An app"});
    root.addFlag(FlagSpec::number("port", "p", "port to listen on"));

    EXPECT_EQ(cobra::renderHelp(root),
              "An app\n"
              "\n"
              "Usage:\n"
              "  app [file]\n"
              "\n"
              "Flags:\n"
              "  -h, --help   display app's help\n"
              "  -p, --port   port to listen on\n");
}

TEST(Help, ParentListsChildrenSortedByUse) {
    RootCommand root(CommandSpec{"app"});
    root.addCommand(CommandSpec{"serve [port]", "Start the server"});
    root.addCommand(CommandSpec{"build", "Build it"});
    root.addCommand(CommandSpec{"db"});

    EXPECT_EQ(cobra::renderHelp(root),
              "app\n"
              "\n"
              "Usage:\n"
              "  app [commands]\n"
              "\n"
              "Available Commands:\n"
              "  build   Build it\n"
              "  db      \n"
              "  serve   Start the server\n"
              "\n"
              "Flags:\n"
              "  -h, --help   display app's help\n");

    // Rendering sorts a copy; insertion order is kept.
    EXPECT_EQ(root.commands().front()->name(), "serve");
}

TEST(Help, MixedFlagRows) {
    Command cmd(CommandSpec{"tool"});
    cmd.addFlag(FlagSpec::number("port", "p", "port number"));
    cmd.addFlag(FlagSpec::string("output", "", "output file"));
    cmd.addFlag(FlagSpec::boolean("", "v", "verbose"));

    EXPECT_EQ(cobra::renderHelp(cmd),
              "tool\n"
              "\n"
              "Usage:\n"
              "  tool\n"
              "\n"
              "Flags:\n"
              "  -v             verbose\n"
              "      --output   output file\n"
              "  -p, --port     port number\n");
}

TEST(Help, NoFlagsNoFlagSection) {
    Command cmd(CommandSpec{"tool", "Does things"});
    EXPECT_EQ(cobra::renderHelp(cmd), "Does things\n\nUsage:\n  tool\n");
}

TEST(Help, Headlines) {
    Command both(CommandSpec{"a", "short text", "long text"});
    EXPECT_EQ(cobra::renderHelp(both).rfind("short text\n", 0), 0u);
    EXPECT_EQ(cobra::renderHelp(both, HelpForm::Long).rfind("long text\n", 0), 0u);

    Command shortOnly(CommandSpec{"b", "short text"});
    EXPECT_EQ(cobra::renderHelp(shortOnly, HelpForm::Long).rfind("short text\n", 0), 0u);

    Command bare(CommandSpec{"c <arg>"});
    EXPECT_EQ(cobra::renderHelp(bare, HelpForm::Long).rfind("c <arg>\n", 0), 0u);
}

TEST(Help, ChildShowsInheritedPersistentFlags) {
    RootCommand root(CommandSpec{"app"});
    root.addFlag(FlagSpec::string("config", "c", "config file").markPersistent());
    root.addFlag(FlagSpec::boolean("local", "l", "root only"));
    auto& sub = root.addCommand(CommandSpec{"sub", "A subcommand"});

    EXPECT_EQ(cobra::renderHelp(sub),
              "A subcommand\n"
              "\n"
              "Usage:\n"
              "  sub\n"
              "\n"
              "Flags:\n"
              "  -c, --config   config file\n"
              "  -h, --help     display app's help\n");
}

TEST(Help, WrittenToErrorStream) {
    std::ostringstream out;
    std::ostringstream err;
    cobra::StreamRuntime runtime(out, err);
    RootCommand root(CommandSpec{"app"});
    root.setRuntime(runtime);

    root.help();
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), cobra::renderHelp(root));
}

TEST(Help, ListingsIgnoreCaseWhenSorting) {
    RootCommand root(CommandSpec{"app"});
    root.addCommand(CommandSpec{"Zeta", "last"});
    root.addCommand(CommandSpec{"beta", "second"});
    root.addCommand(CommandSpec{"alpha", "first"});
    root.addFlag(FlagSpec::boolean("Verbose", "V", "talk more"));
    root.addFlag(FlagSpec::boolean("all", "a", "everything"));

    EXPECT_EQ(cobra::renderHelp(root),
              "app\n"
              "\n"
              "Usage:\n"
              "  app [commands]\n"
              "\n"
              "Available Commands:\n"
              "  alpha   first\n"
              "  beta    second\n"
              "  Zeta    last\n"
              "\n"
              "Flags:\n"
              "  -a, --all       everything\n"
              "  -h, --help      display app's help\n"
              "  -V, --Verbose   talk more\n");
}

TEST(Help, CollateLess) {
    using cobra::utils::collateLess;
    EXPECT_TRUE(collateLess("alpha", "Zeta"));
    EXPECT_FALSE(collateLess("Zeta", "alpha"));
    EXPECT_TRUE(collateLess("ab", "abc"));
    EXPECT_TRUE(collateLess("a", "A"));
    EXPECT_FALSE(collateLess("A", "a"));
    EXPECT_FALSE(collateLess("same", "same"));
    EXPECT_TRUE(collateLess("", "x"));
}

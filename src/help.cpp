#include "cobra/help.hpp"

#include <algorithm>
#include <sstream>

#include "cobra/command.hpp"
#include "cobra/utils.hpp"

namespace cobra {

FlagPad calcPad(const std::vector<std::pair<std::string, std::string>>& names) {
    FlagPad pad;
    for (const auto& [shortName, longName] : names) {
        pad.shortLen = std::max(pad.shortLen, shortName.size());
        pad.longLen = std::max(pad.longLen, longName.size());
    }
    return pad;
}

std::string flagHelp(const Flag& flag, const FlagPad& pad) {
    std::size_t shortWidth = pad.shortLen;
    std::size_t longWidth = pad.longLen;
    if (shortWidth) shortWidth += 3; // dash + short + comma + space
    if (longWidth) longWidth += 2;   // dash + dash + name

    std::string sf;
    if (!flag.shortName().empty()) {
        sf = "-" + flag.shortName() + (flag.name().empty() ? "  " : ", ");
    }
    std::string lf;
    if (!flag.name().empty()) lf = "--" + flag.name();

    return utils::padEnd(std::move(sf), shortWidth) + utils::padEnd(std::move(lf), longWidth) + "   " + flag.usage();
}

std::string renderHelp(const Command& cmd, HelpForm form) {
    std::ostringstream oss;

    const auto& headline = !cmd.shortDesc().empty() ? cmd.shortDesc() : cmd.use();
    if (form == HelpForm::Long && !cmd.longDesc().empty()) {
        oss << cmd.longDesc() << "\n";
    } else {
        oss << headline << "\n";
    }

    oss << "\nUsage:\n";
    if (cmd.commands().empty()) {
        oss << "  " << cmd.use() << "\n";
    } else {
        oss << "  " << cmd.name() << " [commands]\n";

        std::vector<const Command*> children;
        children.reserve(cmd.commands().size());
        for (const auto& c : cmd.commands()) children.push_back(c.get());
        std::stable_sort(children.begin(), children.end(), [](const Command* a, const Command* b) {
            return utils::collateLess(a->use(), b->use());
        });

        std::size_t width = 0;
        for (const auto* c : children) width = std::max(width, c->name().size());

        oss << "\nAvailable Commands:\n";
        for (const auto* c : children) {
            oss << "  " << utils::padEnd(c->name(), width) << "   " << c->shortDesc() << "\n";
        }
    }

    auto flags = cmd.getFlags();
    if (!flags.empty()) {
        std::stable_sort(flags.begin(), flags.end(), [](const Flag* a, const Flag* b) {
            return utils::collateLess(a->name(), b->name());
        });

        std::vector<std::pair<std::string, std::string>> names;
        names.reserve(flags.size());
        for (const auto* f : flags) names.emplace_back(f->shortName(), f->name());
        const auto pad = calcPad(names);

        oss << "\nFlags:\n";
        for (const auto* f : flags) oss << "  " << flagHelp(*f, pad) << "\n";
    }

    return oss.str();
}

} // namespace cobra

#include "cli/commands/HelpCommand.hpp"

#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

namespace gitv {

namespace {

void printCommandDetail(std::ostream& out, const ICommand& cmd) {
    out << "Name:\n" << cmd.helpNameLine() << "\n\n";
    out << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    out << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        out << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            out << opt << " :  " << desc << "\n\n";
        }
    }
}

}

Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::ostream& out = ctx.output();
    if (!args.empty()) {
        const std::string& topic = args.front();
        auto cmd = factory.create(topic);
        if (cmd) {
            printCommandDetail(out, *cmd);
            return {};
        }
        Logger::instance().warn("Unknown help topic: " + topic);
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    factory.listCommands(cmds);

    out << "Usage: gitv <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& c : cmds) {
        out << "  " << c->name() << "\t" << c->description() << "\n";
    }
    out << "\nExamples:\n";
    out << "  gitv add ~/projects          Scan ~/projects folder for Git repositories\n";
    out << "  gitv stats john@example.com  Show contribution graph for john@example.com\n";
    return {};
}

}
